#pragma once

namespace bootverdict {

enum class Target {
    Amd64,
    Arm64,
    Riscv64
};

enum class CheckId {
    KernelLoaded,
    InitramfsLoaded,
    InstallerStarted,
    NoPanic,
    ReachedShell
};

enum class CheckPolarity {
    RequirePresent,
    RequireAbsent
};

enum class OutcomeKind {
    Classified,
    Indeterminate
};

} // namespace bootverdict
