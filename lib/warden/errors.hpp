// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cassert>
#include <system_error>

namespace warden
{

enum ErrorCode : int
{
    SUCCESS = 0,
    INVALID_ARGUMENTS_LENGTH,
    VALUE_MISMATCH,
    INVALID_CALLDATA_PREFIX,
    INVALID_PREDICATE,
    INVALID_SESSION_ROOT,
    INVALID_BATCH_LENGTH,
    INVALID_TO,
    INVALID_SELECTOR,
    CALLDATA_NOT_EQUALLY_ENCODED,
    INVALID_ARGUMENTS,
    TOKEN_OVERSPENDING,
    GAS_FEE_EXCEEDS_REMAINING_GAS,
    OPERATOR_USAGE_EXHAUSTED,
    SESSION_USAGE_EXCEEDED,
    INVALID_WALLET_OPERATION,
    DELEGATECALL_NOT_ALLOWED,
    INVALID_PAYMASTER,
    INVALID_VALIDATION_DURATION,
    INVALID_PERMIT_VALIDATOR,
    INVALID_PERMIT_SIGNATURE,
    PERMIT_REVOKED,
    MALFORMED_SIGNATURE,
    MALFORMED_CALLDATA,
    REENTRANT_CALL,
    VALIDATOR_NOT_ENABLED,
    INVALID_VALIDATOR_TYPE,
    UNKNOWN_ERROR,
};

/// Obtains a reference to the static error category object for warden errors.
inline const std::error_category& warden_category() noexcept
{
    struct Category : std::error_category
    {
        [[nodiscard]] const char* name() const noexcept final { return "warden"; }

        [[nodiscard]] std::string message(int ev) const noexcept final
        {
            switch (ev)
            {
            case SUCCESS:
                return "";
            case INVALID_ARGUMENTS_LENGTH:
                return "invalid arguments length";
            case VALUE_MISMATCH:
                return "msg.value not corresponding to parsed value";
            case INVALID_CALLDATA_PREFIX:
                return "invalid calldata prefix";
            case INVALID_PREDICATE:
                return "invalid predicate";
            case INVALID_SESSION_ROOT:
                return "invalid session root";
            case INVALID_BATCH_LENGTH:
                return "invalid batch length";
            case INVALID_TO:
                return "invalid to";
            case INVALID_SELECTOR:
                return "invalid selector";
            case CALLDATA_NOT_EQUALLY_ENCODED:
                return "rlpCalldata is not equally encoded from execution data";
            case INVALID_ARGUMENTS:
                return "invalid arguments";
            case TOKEN_OVERSPENDING:
                return "token overspending";
            case GAS_FEE_EXCEEDS_REMAINING_GAS:
                return "gas fee exceeds remaining gas";
            case OPERATOR_USAGE_EXHAUSTED:
                return "operator usage exhausted";
            case SESSION_USAGE_EXCEEDED:
                return "session usage exceeded";
            case INVALID_WALLET_OPERATION:
                return "invalid wallet operation";
            case DELEGATECALL_NOT_ALLOWED:
                return "delegatecall not allowed";
            case INVALID_PAYMASTER:
                return "invalid paymaster";
            case INVALID_VALIDATION_DURATION:
                return "invalid validation duration";
            case INVALID_PERMIT_VALIDATOR:
                return "invalid permit validator";
            case INVALID_PERMIT_SIGNATURE:
                return "invalid permit signature";
            case PERMIT_REVOKED:
                return "permit revoked";
            case MALFORMED_SIGNATURE:
                return "malformed signature";
            case MALFORMED_CALLDATA:
                return "malformed calldata";
            case REENTRANT_CALL:
                return "reentrant call";
            case VALIDATOR_NOT_ENABLED:
                return "validator is not enabled";
            case INVALID_VALIDATOR_TYPE:
                return "invalid validator type";
            case UNKNOWN_ERROR:
                return "Unknown error";
            default:
                assert(false);
                return "Wrong error code";
            }
        }
    };

    static const Category category_instance;
    return category_instance;
}

/// Creates error_code object out of a warden error code value.
inline std::error_code make_error_code(ErrorCode errc) noexcept
{
    return {errc, warden_category()};
}

/// The hard validation failure. Throwing it reverts the validation call:
/// all permission store changes made by the call are rolled back.
class ValidationError : public std::system_error
{
public:
    explicit ValidationError(ErrorCode errc) : std::system_error{make_error_code(errc)} {}
    explicit ValidationError(std::error_code ec) : std::system_error{ec} {}
};

}  // namespace warden
