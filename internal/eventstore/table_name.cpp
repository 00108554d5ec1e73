#include "table_name.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace healthd::eventstore {

namespace {

std::string ReplaceAll(std::string_view in, std::string_view from, std::string_view to) {
  std::string out;
  out.reserve(in.size());

  std::size_t pos = 0;
  while (true) {
    const auto hit = in.find(from, pos);
    if (hit == std::string_view::npos) {
      out.append(in.substr(pos));
      break;
    }
    out.append(in.substr(pos, hit - pos));
    out.append(to);
    pos = hit + from.size();
  }
  return out;
}

} // namespace

std::string DefaultTableName(std::string_view logical_name) {
  std::string c = ReplaceAll(logical_name, " ", "_");
  c             = ReplaceAll(c, "-", "_");
  c             = ReplaceAll(c, "__", "_");
  for (auto& ch : c) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }

  std::string table = "components_";
  table += c;
  table += "_events_";
  table += kSchemaVersion;
  return table;
}

bool IsSafeTableName(std::string_view table_name) {
  if (table_name.empty()) return false;
  for (char ch : table_name) {
    const auto u = static_cast<unsigned char>(ch);
    if (u >= 0x80 || !(std::isalnum(u) || ch == '_')) return false;
  }
  return true;
}

std::string DeriveTableName(std::string_view logical_name) {
  auto table = DefaultTableName(logical_name);
  if (!IsSafeTableName(table)) {
    throw util::InvalidArgument("invalid bucket name \"" + std::string(logical_name) + "\": derived table name " + table +
                                " contains characters outside [A-Za-z0-9_]");
  }
  return table;
}

} // namespace healthd::eventstore
