// staged_changeset.cpp - StagedChangeset and IndexPath formatting

#include <listkit/staged_changeset.h>

#include <iostream>
#include <sstream>

namespace listkit {

// ============================================================
// IndexPath
// ============================================================

std::string to_string(const IndexPath& path)
{
    std::ostringstream oss;
    oss << path;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const IndexPath& path)
{
    return os << "[" << path.section << ", " << path.item << "]";
}

// ============================================================
// StagedChangeset
// ============================================================

bool StagedChangeset::has_structural_changes() const noexcept
{
    return !section_deletes.empty() || !section_inserts.empty() || !section_moves.empty() ||
           !item_deletes.empty() || !item_inserts.empty() || !item_moves.empty();
}

bool StagedChangeset::empty() const noexcept
{
    return !has_structural_changes() && section_reloads.empty() && item_reloads.empty() &&
           item_reconfigures.empty();
}

std::size_t StagedChangeset::operation_count() const noexcept
{
    return section_deletes.size() + section_inserts.size() + section_moves.size() + section_reloads.size() +
           item_deletes.size() + item_inserts.size() + item_moves.size() + item_reloads.size() +
           item_reconfigures.size();
}

namespace {

template <typename T>
void write_list(std::ostringstream& oss, const char* label, const std::vector<T>& list)
{
    if (list.empty()) {
        return;
    }
    oss << "  " << label << ":";
    for (const auto& v : list) {
        oss << " " << v;
    }
    oss << "\n";
}

void write_moves(std::ostringstream& oss, const char* label, const std::vector<Move>& moves)
{
    if (moves.empty()) {
        return;
    }
    oss << "  " << label << ":";
    for (const auto& m : moves) {
        oss << " " << m.from << "->" << m.to;
    }
    oss << "\n";
}

void write_moves(std::ostringstream& oss, const char* label, const std::vector<ItemMove>& moves)
{
    if (moves.empty()) {
        return;
    }
    oss << "  " << label << ":";
    for (const auto& m : moves) {
        oss << " " << m.from << "->" << m.to;
    }
    oss << "\n";
}

} // namespace

std::string StagedChangeset::to_string() const
{
    std::ostringstream oss;
    if (empty()) {
        oss << "StagedChangeset (empty)\n";
        return oss.str();
    }
    oss << "StagedChangeset (" << operation_count() << " operations)\n";
    write_list(oss, "section deletes", section_deletes);
    write_list(oss, "section inserts", section_inserts);
    write_moves(oss, "section moves", section_moves);
    write_list(oss, "section reloads", section_reloads);
    write_list(oss, "item deletes", item_deletes);
    write_list(oss, "item inserts", item_inserts);
    write_moves(oss, "item moves", item_moves);
    write_list(oss, "item reloads", item_reloads);
    write_list(oss, "item reconfigures", item_reconfigures);
    return oss.str();
}

void StagedChangeset::print() const
{
    std::cout << to_string();
}

} // namespace listkit
