#ifndef ET_COMMON_HPP
#define ET_COMMON_HPP

#include <algorithm>  // std::transform(), std::max()
#include <cinttypes>  // PRIu64, etc
#include <cstddef>    // size_t
#include <cstdint>    // uint8_t, etc
#include <functional> // std::function
#include <memory>     // std::shared_ptr, std::weak_ptr

#endif
