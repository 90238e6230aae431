#pragma once
#include "aries/core/constants.hpp"
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/crypto/sodium_interop.hpp"
#include "aries/debug/protocol_trace.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>
namespace aries::protocol {
/// Owns engine objects behind opaque, random, non-zero uint32 handles.
///
/// The map is guarded by a shared mutex; each slot carries its own mutex held
/// for the whole of WithHandle, which serializes all calls on one handle while
/// different handles proceed in parallel. Released or never-issued handles
/// fail with InvalidHandle.
template<typename T>
class HandleRegistry {
public:
    explicit HandleRegistry(std::string kind)
        : kind_(std::move(kind)) {}
    HandleRegistry(const HandleRegistry&) = delete;
    HandleRegistry& operator=(const HandleRegistry&) = delete;
    [[nodiscard]] Result<uint32_t, ProtocolFailure> Add(T object) {
        auto slot = std::make_shared<Slot>(std::move(object));
        std::unique_lock lock(lock_);
        for (uint32_t attempt = 0; attempt < ProtocolConstants::MAX_HANDLE_ALLOCATION_ATTEMPTS; ++attempt) {
            const uint32_t handle = crypto::SodiumInterop::GenerateRandomUInt32(true);
            if (slots_.contains(handle)) {
                continue;
            }
            slots_.emplace(handle, std::move(slot));
            ARIES_TRACE(debug::Component::Registry, "{} handle {} created", kind_, handle);
            return Result<uint32_t, ProtocolFailure>::Ok(handle);
        }
        return Result<uint32_t, ProtocolFailure>::Err(
            ProtocolFailure::Generic("Failed to allocate a unique " + kind_ + " handle"));
    }
    /// Runs fn(T&) under the handle's lock. fn returns Result<R, ProtocolFailure>.
    template<typename F>
    [[nodiscard]] auto WithHandle(const uint32_t handle, F&& fn) const
        -> std::invoke_result_t<F, T&> {
        using ResultType = std::invoke_result_t<F, T&>;
        auto slot = Find(handle);
        if (!slot) {
            return ResultType::Err(UnknownHandle(handle));
        }
        std::lock_guard slot_lock(slot->lock);
        return std::forward<F>(fn)(slot->object);
    }
    [[nodiscard]] Result<Unit, ProtocolFailure> Release(const uint32_t handle) {
        std::unique_lock lock(lock_);
        if (slots_.erase(handle) == 0) {
            return Result<Unit, ProtocolFailure>::Err(UnknownHandle(handle));
        }
        ARIES_TRACE(debug::Component::Registry, "{} handle {} released", kind_, handle);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
    [[nodiscard]] bool Contains(const uint32_t handle) const {
        std::shared_lock lock(lock_);
        return slots_.contains(handle);
    }
    [[nodiscard]] size_t Size() const {
        std::shared_lock lock(lock_);
        return slots_.size();
    }
    [[nodiscard]] std::vector<uint32_t> Handles() const {
        std::shared_lock lock(lock_);
        std::vector<uint32_t> handles;
        handles.reserve(slots_.size());
        for (const auto& [handle, slot] : slots_) {
            handles.push_back(handle);
        }
        return handles;
    }
    [[nodiscard]] const std::string& Kind() const noexcept { return kind_; }
private:
    struct Slot {
        explicit Slot(T value) : object(std::move(value)) {}
        std::mutex lock;
        T object;
    };
    [[nodiscard]] std::shared_ptr<Slot> Find(const uint32_t handle) const {
        std::shared_lock lock(lock_);
        const auto it = slots_.find(handle);
        return it != slots_.end() ? it->second : nullptr;
    }
    [[nodiscard]] ProtocolFailure UnknownHandle(const uint32_t handle) const {
        return ProtocolFailure::InvalidHandle(
            std::string(ErrorMessages::UNKNOWN_HANDLE) + ": " + kind_ + " " + std::to_string(handle));
    }
    std::string kind_;
    mutable std::shared_mutex lock_;
    std::unordered_map<uint32_t, std::shared_ptr<Slot>> slots_;
};
}
