#pragma once

#include <ostream>
#include <string_view>
#include <utility>
#include <fmt/ostream.h>

namespace redfa {

/// Facility to log what the compiler is doing.
/// Writes nothing unless an output stream has been set.
class Log {
public:
    enum class Level { Error, Warn, Info, Verbose, Debug };

    Log() = default;
    explicit Log(std::ostream* ostream, Level max_level = Level::Error)
        : ostream_(ostream), max_level_(max_level) {}

    /// @name Getters
    ///@{
    Level level() const { return max_level_; }
    std::ostream* ostream() const { return ostream_; }
    explicit operator bool() const { return ostream_ != nullptr; }
    ///@}

    /// @name Setters
    ///@{
    Log& set(std::ostream* ostream) {
        ostream_ = ostream;
        return *this;
    }
    Log& set(Level max_level) {
        max_level_ = max_level;
        return *this;
    }
    ///@}

    template <class... Args>
    void log(Level level,
             fmt::format_string<Args...> format,
             Args&&... args) const {
        if (ostream_ && level <= max_level_) {
            fmt::print(*ostream_, "{}: ", level2acro(level));
            fmt::print(*ostream_, format, std::forward<Args>(args)...);
            *ostream_ << std::endl;
        }
    }

    static std::string_view level2acro(Level level);

private:
    std::ostream* ostream_ = nullptr;
    Level max_level_ = Level::Error;
};

/// @name Logging Macros
/// Take a `const Log*`; a null pointer disables the call.
///@{
// clang-format off
#define REDFA_ELOG(logger, ...) do { if (logger) (logger)->log(redfa::Log::Level::Error,   __VA_ARGS__); } while (false)
#define REDFA_ILOG(logger, ...) do { if (logger) (logger)->log(redfa::Log::Level::Info,    __VA_ARGS__); } while (false)
#define REDFA_VLOG(logger, ...) do { if (logger) (logger)->log(redfa::Log::Level::Verbose, __VA_ARGS__); } while (false)
#ifndef NDEBUG
#define REDFA_DLOG(logger, ...) do { if (logger) (logger)->log(redfa::Log::Level::Debug,   __VA_ARGS__); } while (false)
#else
#define REDFA_DLOG(logger, ...) do {} while (false)
#endif
// clang-format on
///@}

}  // namespace redfa
