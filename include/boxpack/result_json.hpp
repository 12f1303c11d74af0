#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include "boxpack/box_catalog.hpp"
#include "boxpack/packing.hpp"

namespace boxpack {

std::string json_escape(std::string_view s);

void write_pack_result_json(std::ostream& out, const PackResult& result);
void write_catalog_json(std::ostream& out, const BoxCatalog& catalog);

}  // namespace boxpack
