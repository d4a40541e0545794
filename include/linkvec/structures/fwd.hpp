#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for linkvec_structures types

#include <cstddef>

namespace linkvec_structures {

// =============================================================================
// Forward Declarations
// =============================================================================

/// Position in an IndexedList slot array
using SlotIndex = std::size_t;

/// Element plus next-link stored in an IndexedList slot
template<typename T>
class LinkedSlot;

/// Array-backed singly linked list with slot recycling
template<typename T>
class IndexedList;

} // namespace linkvec_structures
