#ifndef METACOMP_ERRORS_HPP
#define METACOMP_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace metacomp {
    enum struct ErrorCode {
        UnknownUnit,
        InvalidRegistry,
        InvalidOddsTable,
        InvalidDeck,
        InvalidLevel,
        PoolUnderflow,
        PoolOverflow,
        EmptyCandidateSet,
        InvalidData,
        InvalidConfig,
    };

    constexpr auto to_string(ErrorCode code) noexcept -> std::string_view {
        switch (code) {
        case ErrorCode::UnknownUnit: return "UnknownUnit";
        case ErrorCode::InvalidRegistry: return "InvalidRegistry";
        case ErrorCode::InvalidOddsTable: return "InvalidOddsTable";
        case ErrorCode::InvalidDeck: return "InvalidDeck";
        case ErrorCode::InvalidLevel: return "InvalidLevel";
        case ErrorCode::PoolUnderflow: return "PoolUnderflow";
        case ErrorCode::PoolOverflow: return "PoolOverflow";
        case ErrorCode::EmptyCandidateSet: return "EmptyCandidateSet";
        case ErrorCode::InvalidData: return "InvalidData";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        }
        return "Unknown";
    }

    // Bad input from a collaborator. Never retried by the engine.
    class Error : public std::runtime_error {
    public:
        Error(ErrorCode code, const std::string& message)
            : std::runtime_error(message), error_code(code)
        { }

        ErrorCode code() const noexcept { return error_code; }

    private:
        ErrorCode error_code;
    };

    // A probability left [0, 1]. This is a defect in the engine, not bad input.
    class ProbabilityInvariantError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };
}
#endif
