#pragma once

#include <memory>
#include <type_traits>
#include <utility>

namespace svcdi {

// ---------------------------------------------------------------
// erased_ref: type-erased shared instance handle
// ---------------------------------------------------------------

/// Every cached or freshly created instance travels through the core as a
/// `std::shared_ptr<void>`.  The stored address is always the address of the
/// *contract* sub-object, never the implementation, so that
/// `std::static_pointer_cast<TInterface>` round-trips correctly even under
/// multiple or virtual inheritance.  The control block keeps the original
/// deleter, so no virtual destructor is needed on the contract.
using erased_ref = std::shared_ptr<void>;

/// Create a `new TImpl(args...)` and erase it as a `TInterface*`.
template <typename TInterface, typename TImpl, typename... Args>
    requires std::is_base_of_v<TInterface, TImpl>
erased_ref make_erased_as(Args&&... args) {
    std::shared_ptr<TInterface> typed = std::make_shared<TImpl>(std::forward<Args>(args)...);
    return std::static_pointer_cast<void>(std::move(typed));
}

/// Erase an existing handle as its contract type.
template <typename TInterface>
erased_ref erase_as(std::shared_ptr<TInterface> instance) noexcept {
    return std::static_pointer_cast<void>(std::move(instance));
}

/// Recover a typed handle from an erased one produced for contract T.
template <typename T>
std::shared_ptr<T> unerase(erased_ref instance) noexcept {
    return std::static_pointer_cast<T>(std::move(instance));
}

} // namespace svcdi
