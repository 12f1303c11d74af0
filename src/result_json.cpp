#include "boxpack/result_json.hpp"

#include <cstdio>
#include <string>

namespace boxpack {
namespace {

void write_dims(std::ostream& out, const Dims& d) {
    out << "{\"length\": " << d.length << ", \"width\": " << d.width << ", \"height\": " << d.height << "}";
}

void write_boxes(std::ostream& out, const PackResult& result) {
    out << "{\n";
    out << "  \"boxes\": [\n";
    for (size_t i = 0; i < result.boxes.size(); ++i) {
        const auto& a = result.boxes[i];
        out << "    {\"box_id\": \"" << json_escape(a.box.id) << "\", \"dimensions\": ";
        write_dims(out, a.box.dims);
        out << ", \"items\": [";
        for (size_t j = 0; j < a.items.size(); ++j) {
            if (j > 0) {
                out << ", ";
            }
            out << "\"" << json_escape(a.items[j].id) << "\"";
        }
        out << "]}";
        if (i + 1 != result.boxes.size()) {
            out << ",";
        }
        out << "\n";
    }
    out << "  ],\n";
    out << "  \"total_boxes\": " << result.total_boxes() << "\n";
    out << "}\n";
}

void write_too_large(std::ostream& out, const PackResult& result) {
    out << "{\n";
    out << "  \"error\": \"" << status_code(result.status) << "\",\n";
    out << "  \"details\": [\n";
    for (size_t i = 0; i < result.oversized.size(); ++i) {
        const auto& o = result.oversized[i];
        out << "    {\"sku\": \"" << json_escape(o.id) << "\", \"dimensions\": ";
        write_dims(out, o.dims);
        out << ", \"max_box_inner_dimensions\": ";
        write_dims(out, o.max_box_dims);
        out << "}";
        if (i + 1 != result.oversized.size()) {
            out << ",";
        }
        out << "\n";
    }
    out << "  ]\n";
    out << "}\n";
}

}  // namespace

std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char ch : s) {
        switch (ch) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                    out += buf;
                } else {
                    out += ch;
                }
                break;
        }
    }
    return out;
}

void write_pack_result_json(std::ostream& out, const PackResult& result) {
    switch (result.status) {
        case PackStatus::kOk:
            write_boxes(out, result);
            return;
        case PackStatus::kItemTooLarge:
            write_too_large(out, result);
            return;
        case PackStatus::kPackingError:
            out << "{\n";
            out << "  \"error\": \"" << status_code(result.status) << "\",\n";
            out << "  \"details\": \"" << json_escape(result.message) << "\"\n";
            out << "}\n";
            return;
    }
}

void write_catalog_json(std::ostream& out, const BoxCatalog& catalog) {
    const auto& boxes = catalog.list_ascending_by_volume();
    out << "{\n";
    out << "  \"boxes\": [\n";
    for (size_t i = 0; i < boxes.size(); ++i) {
        out << "    {\"box_id\": \"" << json_escape(boxes[i].id) << "\", \"dimensions\": ";
        write_dims(out, boxes[i].dims);
        out << ", \"volume\": " << boxes[i].volume() << "}";
        if (i + 1 != boxes.size()) {
            out << ",";
        }
        out << "\n";
    }
    out << "  ]\n";
    out << "}\n";
}

}  // namespace boxpack
