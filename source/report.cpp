// report.cpp

#include <keydiff/report.h>

namespace keydiff {

std::string_view change_label(ChangeKind kind) noexcept
{
    switch (kind) {
        case ChangeKind::Add:    return "ADD   ";
        case ChangeKind::Remove: return "REMOVE";
        case ChangeKind::Modify: return "MODIFY";
    }
    return "??????";
}

namespace detail {

void write_indent(std::ostream& os, std::size_t depth)
{
    for (std::size_t i = 0; i < depth; ++i) {
        os << "  ";
    }
}

} // namespace detail

} // namespace keydiff
