#pragma once

#include <vector>

#include "descriptor.hpp"

namespace protodesc {

// Appends the fields of every `extend` block in `files` to the message it
// names. Targets that are not loaded are skipped. Blocks already merged are
// left alone, so running this twice changes nothing.
// Returns the number of blocks merged by this call.
std::size_t merge_extensions(const std::vector<ProtoFile*>& files);

}  // namespace protodesc
