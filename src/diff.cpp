#include <jsonpatch-cpp/diff.hpp>

#include "diff_builder.hpp"

#include <optional>

namespace jsonpatch_cpp {

auto make_patch(const Value& src, const Value& dst, const DiffOptions& options) -> Patch {
    auto builder = detail::DiffBuilder{options};
    builder.compare_values(Pointer{}, std::nullopt, src, dst);
    return Patch{builder.execute()};
}

}  // namespace jsonpatch_cpp
