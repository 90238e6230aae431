#pragma once
#include "aries/core/result.hpp"
#include "aries/core/failures.hpp"
#include <functional>
#include <span>
#include <string_view>
namespace aries::protocol::interfaces {
using protocol::Result;
using protocol::Unit;
using protocol::ProtocolFailure;
/// Lends an Ed25519 secret key, addressed by its base58 verkey, to an operation
/// without handing ownership of the key material to the caller.
class IKeyProvider {
public:
    virtual ~IKeyProvider() = default;
    [[nodiscard]] virtual bool HasKey(std::string_view verkey) const = 0;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> ExecuteWithKey(
        std::string_view verkey,
        std::function<Result<Unit, ProtocolFailure>(std::span<const uint8_t>)> operation) const = 0;
    template<typename T>
    [[nodiscard]] Result<T, ProtocolFailure> ExecuteWithKeyTyped(
        std::string_view verkey,
        std::function<Result<T, ProtocolFailure>(std::span<const uint8_t>)> operation) const {
        Result<T, ProtocolFailure> result_holder =
            Result<T, ProtocolFailure>::Err(
                ProtocolFailure::Generic("Operation not executed"));
        auto wrapper = [&operation, &result_holder](std::span<const uint8_t> key)
            -> Result<Unit, ProtocolFailure> {
            result_holder = operation(key);
            return result_holder.IsOk()
                ? Result<Unit, ProtocolFailure>::Ok(Unit{})
                : Result<Unit, ProtocolFailure>::Err(result_holder.UnwrapErr());
        };
        auto exec_result = ExecuteWithKey(verkey, wrapper);
        if (exec_result.IsErr()) {
            return Result<T, ProtocolFailure>::Err(exec_result.UnwrapErr());
        }
        return result_holder;
    }
};
}
