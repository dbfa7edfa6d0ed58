#include "csv_cleaner/field_cleaner.hpp"
#include "csv_cleaner/text_utils.hpp"

namespace cc {

std::string clean_field(std::string_view field) {
  std::string_view v = trim(field);

  // ",value" : the field swallowed a separator
  if (starts_with(v, ',')) v = trim(v.substr(1));

  if (v.size() > 1 && v.front() == '"' && v.back() == '"') {
    std::string_view inner = v.substr(1, v.size() - 2);
    // "value," : malformed quoted field, drop the comma with the quotes
    if (ends_with(inner, ',')) inner.remove_suffix(1);
    // Re-quoting (if the content needs it) happens in the writer.
    return std::string(inner);
  }

  if (ends_with(v, ',')) v = trim(v.substr(0, v.size() - 1));
  return std::string(v);
}

}
