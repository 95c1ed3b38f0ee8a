#pragma once

#include <csignal>

namespace ringframe {

/// Installs SIGINT and SIGTERM handlers that only raise a flag, and puts
/// the previous handlers back on destruction.
///
/// The flag is process-wide, so only one StopSignal should be alive at a
/// time. Nothing the handler touches can dangle once the owner is gone.
class StopSignal {
public:
    StopSignal() noexcept;
    ~StopSignal();

    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    /// True once SIGINT or SIGTERM arrived while this guard was installed.
    [[nodiscard]] bool requested() const noexcept;

private:
    using Handler = void (*)(int);

    Handler previous_int_ = SIG_DFL;
    Handler previous_term_ = SIG_DFL;
};

}  // namespace ringframe
