#pragma once
#include <string>
#include <vector>

namespace cc {

// One logical CSV record. Fields carry no quoting once tokenized.
using Field = std::string;
using Row   = std::vector<Field>;

}
