#pragma once

/// @file structures.hpp
/// @brief Main include for linkvec_structures module
///
/// - IndexedList<T> / LinkedSlot<T>: singly linked list in one slot array
///
/// @example Basic usage:
/// @code
/// #include <linkvec/structures/structures.hpp>
///
/// using namespace linkvec_structures;
///
/// IndexedList<int> list;
/// list.push_back(100);
/// list.push_back(200);
/// list.push_front(300);     // 300 100 200
///
/// auto first = list.pop_front();   // 300, its slot is recycled
/// int last = list.remove(1);       // 200
/// list.push_back(400);             // reuses a free slot, true_len() stays 3
/// @endcode

#include "fwd.hpp"
#include "indexed_list.hpp"

namespace linkvec_structures {

/// Version information
struct Version {
    static constexpr int MAJOR = 1;
    static constexpr int MINOR = 0;
    static constexpr int PATCH = 0;
};

} // namespace linkvec_structures
