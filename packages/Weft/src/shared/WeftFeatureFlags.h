#pragma once

namespace weft {

// A region appended at the end of its parent keeps a placeholder as its anchor
// when it becomes empty.
inline constexpr bool enableEmptyRegionPlaceholder = true;

// The memory host keeps a journal of every mutation it performs.
inline constexpr bool enableHostOperationJournal = true;

} // namespace weft
