#pragma once

#include <memory>

#include <noscrypt.h>

namespace nostrcast
{
namespace internal
{
/**
 * @brief Allocates and initializes a noscrypt library context with fresh secure entropy.
 * @returns A shared context that is destroyed and freed with its last owner.
 * @throws `std::runtime_error` if the context could not be initialized.
 */
std::shared_ptr<NCContext> createNoscryptContext();
} // namespace internal
} // namespace nostrcast
