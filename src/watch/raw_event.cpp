#include "fwr/watch/raw_event.hpp"

#include <array>
#include <utility>

namespace fwr::watch {

std::string opName(Op op) {
    static constexpr std::array<std::pair<Op, std::string_view>, 5> kNames = {{
        {Op::Create, "CREATE"},
        {Op::Write, "WRITE"},
        {Op::Remove, "REMOVE"},
        {Op::Rename, "RENAME"},
        {Op::Chmod, "CHMOD"},
    }};

    std::string out;
    for (const auto& [flag, name] : kNames) {
        if (hasOp(op, flag)) {
            if (!out.empty()) {
                out += '|';
            }
            out += name;
        }
    }
    return out.empty() ? std::string("NONE") : out;
}

} // namespace fwr::watch
