#pragma once

#include <cstdint>
#include <type_traits>
#include <utility>

#include <unknwn.h>

#pragma warning(push)
// WIL: C4625 (copy ctor deleted), C4626 (copy assign deleted), C5026 (move ctor deleted), C5027 (move assign deleted)
#pragma warning(disable : 4625 4626 5026 5027)
#include <wil/com.h>
#include <wil/resource.h>
#pragma warning(pop)

#include "Contract.h"

namespace WideShell
{
// Lifecycle of the single reference an ExternalHandle owns.
//   Unreleased -> Released  (destruction or Release())
//   Unreleased -> Disarmed  (Disarm() / HandOff(): the foreign side now owns the reference)
// Both targets are terminal.
enum class HandleState : uint8_t
{
    Unreleased,
    Released,
    Disarmed,
};

[[nodiscard]] constexpr const wchar_t* HandleStateName(HandleState state) noexcept
{
    switch (state)
    {
        case HandleState::Unreleased: return L"Unreleased";
        case HandleState::Released: return L"Released";
        case HandleState::Disarmed: return L"Disarmed";
    }
    return L"Unknown";
}

// Owns exactly one reference on a foreign reference-counted object.
// The reference is released once, unless it was handed off, in which case the wrapper never touches it again.
template <typename T> class ExternalHandle final
{
public:
    // Takes over the reference returned by a factory call that reported success.
    // A null pointer here means the foreign contract is broken.
    [[nodiscard]] static ExternalHandle Adopt(T* raw) noexcept
    {
        Contract::Check(raw != nullptr, L"a foreign call reported success but returned a null pointer");
        return ExternalHandle(raw);
    }

    ExternalHandle(const ExternalHandle&)            = delete;
    ExternalHandle& operator=(const ExternalHandle&) = delete;

    // The moved-from handle no longer holds the reference and ends Disarmed.
    ExternalHandle(ExternalHandle&& other) noexcept : _ptr(std::move(other._ptr)), _state(other._state)
    {
        other._state = HandleState::Disarmed;
    }

    ExternalHandle& operator=(ExternalHandle&& other) noexcept
    {
        if (this != &other)
        {
            Release();
            _ptr         = std::move(other._ptr);
            _state       = other._state;
            other._state = HandleState::Disarmed;
        }
        return *this;
    }

    ~ExternalHandle() noexcept
    {
        Release();
    }

    [[nodiscard]] HandleState State() const noexcept
    {
        return _state;
    }

    // The raw pointer, for a call that borrows it. Only valid while the handle is Unreleased.
    [[nodiscard]] T* Get() const noexcept
    {
        Contract::Check(_state == HandleState::Unreleased, L"ExternalHandle used after its reference was released or handed off");
        return _ptr.get();
    }

    T* operator->() const noexcept
    {
        return Get();
    }

    // Releases the reference now. No-op once the handle left Unreleased.
    void Release() noexcept
    {
        if (_state != HandleState::Unreleased)
        {
            return;
        }
        _ptr.reset();
        _state = HandleState::Released;
    }

    // Forgets the reference without releasing it. No-op once the handle left Unreleased.
    void Disarm() noexcept
    {
        if (_state != HandleState::Unreleased)
        {
            return;
        }
        static_cast<void>(_ptr.detach());
        _state = HandleState::Disarmed;
    }

    // Runs a foreign call that consumes this handle's reference, then disarms whatever the call returned.
    template <typename Call> HRESULT HandOff(Call&& call) noexcept(std::is_nothrow_invocable_v<Call, T*>)
    {
        T* const raw = Get();
        auto disarm  = wil::scope_exit([&]() noexcept { Disarm(); });
        return std::forward<Call>(call)(raw);
    }

    // Same object viewed through a base interface, borrowed.
    template <typename Base> [[nodiscard]] Base* As() const noexcept
    {
        static_assert(std::is_base_of_v<Base, T>, "As<Base>() only walks up the interface hierarchy");
        return Get();
    }

private:
    explicit ExternalHandle(T* raw) noexcept
    {
        _ptr.attach(raw);
    }

    wil::com_ptr_nothrow<T> _ptr;
    HandleState _state = HandleState::Unreleased;
};
} // namespace WideShell
