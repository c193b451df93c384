#include "bqa_json.h"
#include "../../utils/bqa_exceptions.h"
#include <nlohmann/json.hpp>
#include <cmath>

namespace bqa {

// Anonymous namespace for conversion helpers
namespace {

  using nlohmann::json;

  // Whole numbers are written as JSON integers so coordinates read as ints come back as ints.
  json number_to_json(double value) {
    if (std::isfinite(value) && std::floor(value) == value &&
        std::fabs(value) < 9007199254740992.0) {
      return static_cast<long long>(value);
    }
    return value;
  }

  std::vector<double> parse_coords(const json& j, const std::string& context) {
    std::vector<double> coords;
    if (j.is_null()) {
      return coords;
    }
    if (!j.is_array()) {
      throw bqa_schema_error("c", context + " (not a list)");
    }
    coords.reserve(j.size());
    for (const auto& el : j) {
      if (!el.is_number()) {
        throw bqa_schema_error("c", context + " (non-numeric coordinate)");
      }
      coords.push_back(el.get<double>());
    }
    return coords;
  }

  std::optional<std::string> optional_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
      return std::nullopt;
    }
    if (it->is_string()) {
      return it->get<std::string>();
    }
    return it->dump();
  }

  // Present keys are kept as raw JSON text, null included.
  std::optional<std::string> optional_raw(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
      return std::nullopt;
    }
    return it->dump();
  }

  bqa_line parse_line(const json& j, const std::string& context) {
    bqa_line line;
    if (j.is_array() && j.empty()) {
      line.empty_structure = true;
      return line;
    }
    if (!j.is_object()) {
      throw bqa_schema_error("l", context + " (line is not an object)");
    }
    line.empty_structure = j.empty();

    if (j.contains("c")) {
      line.c = parse_coords(j["c"], context);
    }

    auto t_it = j.find("t");
    if (t_it != j.end() && !t_it->is_null()) {
      if (!t_it->is_array()) {
        throw bqa_schema_error("t", context + " (not a list)");
      }
      std::vector<bqa_text_segment> segments;
      segments.reserve(t_it->size());
      for (const auto& seg : *t_it) {
        if (!seg.is_object()) {
          throw bqa_schema_error("t", context + " (segment is not an object)");
        }
        bqa_text_segment segment;
        auto tx_it = seg.find("tx");
        if (tx_it != seg.end() && !tx_it->is_null()) {
          if (!tx_it->is_string()) {
            throw bqa_schema_error("tx", context + " (not a string)");
          }
          segment.tx = tx_it->get<std::string>();
        }
        segments.push_back(std::move(segment));
      }
      line.t = std::move(segments);
    }
    return line;
  }

  bqa_paragraph parse_paragraph(const json& j, const std::string& context) {
    if (!j.is_object()) {
      throw bqa_schema_error("p", context + " (paragraph is not an object)");
    }
    bqa_paragraph paragraph;
    if (j.contains("c")) {
      paragraph.c = parse_coords(j["c"], context);
    }

    auto l_it = j.find("l");
    if (l_it != j.end()) {
      if (!l_it->is_array()) {
        throw bqa_schema_error("l", context + " (not a list)");
      }
      std::vector<bqa_line> lines;
      lines.reserve(l_it->size());
      for (size_t i = 0; i < l_it->size(); ++i) {
        lines.push_back(parse_line((*l_it)[i], context + " line " + std::to_string(i)));
      }
      paragraph.l = std::move(lines);
    }
    return paragraph;
  }

  bqa_region parse_region(const json& j, const std::string& context) {
    if (!j.is_object()) {
      throw bqa_schema_error("r", context + " (region is not an object)");
    }
    bqa_region region;
    if (j.contains("c")) {
      region.c = parse_coords(j["c"], context);
    }
    region.p_of_json = optional_raw(j, "pOf");

    auto p_it = j.find("p");
    if (p_it != j.end()) {
      if (!p_it->is_array()) {
        throw bqa_schema_error("p", context + " (not a list)");
      }
      std::vector<bqa_paragraph> paragraphs;
      paragraphs.reserve(p_it->size());
      for (size_t i = 0; i < p_it->size(); ++i) {
        paragraphs.push_back(parse_paragraph((*p_it)[i], context + " paragraph " + std::to_string(i)));
      }
      region.p = std::move(paragraphs);
    }
    return region;
  }

  json coords_to_json(const std::vector<double>& coords) {
    json arr = json::array();
    for (double v : coords) {
      arr.push_back(number_to_json(v));
    }
    return arr;
  }

  json raw_or_null(const std::optional<std::string>& raw) {
    if (!raw) {
      return nullptr;
    }
    try {
      return json::parse(*raw);
    } catch (const json::parse_error&) {
      return *raw;
    }
  }

  json out_of_bounds_to_json(const std::vector<bqa_out_of_bounds_entry>& entries, const char* seq_key) {
    json arr = json::array();
    for (const auto& entry : entries) {
      json obj = json::object();
      obj[seq_key] = entry.seq;
      obj["coord"] = coords_to_json(entry.coord);
      obj["pOf"] = raw_or_null(entry.p_of_json);
      obj["excess_width"] = number_to_json(entry.excess.width);
      obj["excess_height"] = number_to_json(entry.excess.height);
      obj["excess_x"] = number_to_json(entry.excess.x);
      obj["excess_y"] = number_to_json(entry.excess.y);
      arr.push_back(std::move(obj));
    }
    return arr;
  }

  json descriptive_stats_to_json(const bqa_descriptive_stats& stats) {
    json obj = json::object();
    obj["count"] = stats.count;
    obj["mean"] = stats.mean;
    obj["median"] = stats.median;
    obj["mode"] = stats.mode ? number_to_json(*stats.mode) : json(nullptr);
    obj["min"] = number_to_json(stats.min);
    obj["max"] = number_to_json(stats.max);
    obj["range"] = number_to_json(stats.range);
    obj["variance"] = stats.variance;
    obj["std_dev"] = stats.std_dev;
    obj["skewness"] = stats.skewness;
    obj["kurtosis"] = stats.kurtosis;
    return obj;
  }

  json quad_to_json(const bqa_coord_quad& quad) {
    json obj = json::object();
    obj["x"] = number_to_json(quad.x);
    obj["y"] = number_to_json(quad.y);
    obj["width"] = number_to_json(quad.width);
    obj["height"] = number_to_json(quad.height);
    return obj;
  }

  json page_stats_to_json(const bqa_page_stats& stats) {
    json obj = json::object();
    obj["num_regions"] = stats.num_regions;
    obj["num_paragraphs"] = stats.num_paragraphs;
    obj["num_lines"] = stats.num_lines;
    obj["num_empty_lines"] = stats.num_empty_lines;
    obj["avg_paragraphs_per_region"] = stats.avg_paragraphs_per_region;
    obj["avg_lines_per_region"] = stats.avg_lines_per_region;
    obj["avg_lines_per_paragraph"] = stats.avg_lines_per_paragraph;
    obj["line_width_stats"] = descriptive_stats_to_json(stats.line_width_stats);
    obj["line_height_stats"] = descriptive_stats_to_json(stats.line_height_stats);

    json coverages = json::array();
    for (const auto& coverage : stats.paragraph_coverages) {
      json entry = json::object();
      entry["coords"] = quad_to_json(coverage.coords);
      entry["coverage_percent"] = coverage.coverage_percent;
      coverages.push_back(std::move(entry));
    }
    obj["paragraph_coverages"] = std::move(coverages);
    return obj;
  }

} // namespace

bqa_page bqa_json::parse_page(const std::string& json_text) {
  json j;
  try {
    j = json::parse(json_text);
  } catch (const json::parse_error& e) {
    throw bqa_json_error(std::string("Invalid page JSON: ") + e.what());
  }
  if (!j.is_object()) {
    throw bqa_json_error("Invalid page JSON: record is not an object");
  }

  bqa_page page;
  auto id = optional_string(j, "id");
  if (!id) {
    throw bqa_schema_error("id", "page record");
  }
  page.id = *id;
  page.iiif_img_base_uri = optional_string(j, "iiif_img_base_uri");
  if (!page.iiif_img_base_uri && j.contains("iiif_img_base_uri")) {
    page.iiif_img_base_uri = std::string();
  }
  page.iiif = optional_string(j, "iiif");

  auto cc_it = j.find("cc");
  if (cc_it != j.end()) {
    page.cc_json = cc_it->dump();
  }

  auto r_it = j.find("r");
  if (r_it != j.end()) {
    if (!r_it->is_array()) {
      throw bqa_schema_error("r", "page " + page.id + " (not a list)");
    }
    std::vector<bqa_region> regions;
    regions.reserve(r_it->size());
    for (size_t i = 0; i < r_it->size(); ++i) {
      regions.push_back(parse_region((*r_it)[i], "page " + page.id + " region " + std::to_string(i)));
    }
    page.r = std::move(regions);
  }
  return page;
}

bqa_image_size bqa_json::parse_iiif_info(const std::string& json_text) {
  json j;
  try {
    j = json::parse(json_text);
  } catch (const json::parse_error& e) {
    throw bqa_json_error(std::string("Invalid IIIF info.json: ") + e.what());
  }

  if (!j.is_object() || !j.contains("width") || !j.contains("height") ||
      !j["width"].is_number() || !j["height"].is_number()) {
    throw bqa_json_error("IIIF info.json lacks numeric width/height");
  }

  bqa_image_size size;
  size.width = static_cast<long long>(j["width"].get<double>());
  size.height = static_cast<long long>(j["height"].get<double>());
  return size;
}

std::string bqa_json::create(const bqa_page_report& report) {
  json obj = json::object();
  obj["page_id"] = report.page_id;
  obj["ts"] = report.ts;
  obj["facsimile_width"] = report.facsimile.width;
  obj["facsimile_height"] = report.facsimile.height;
  obj["total_lines"] = report.validation.total_lines;
  obj["out_of_bounds_lines"] = out_of_bounds_to_json(report.validation.out_of_bounds_lines, "line_seq");
  obj["out_of_bounds_paragraphs"] = out_of_bounds_to_json(report.validation.out_of_bounds_paragraphs, "paragraph_seq");
  obj["out_of_bounds_regions"] = out_of_bounds_to_json(report.validation.out_of_bounds_regions, "region_seq");
  obj["pages_stats"] = page_stats_to_json(report.pages_stats);
  obj["cc"] = raw_or_null(report.cc_json);

  json manifest = json::object();
  manifest["iiif_base_uri"] = report.iiif_base_uri;
  obj["iiif_manifest"] = std::move(manifest);

  if (report.error) {
    obj["error"] = *report.error;
  }
  if (report.git_version) {
    obj["git_version"] = *report.git_version;
  }
  return obj.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string bqa_json::create(const bqa_page_stats& stats, const std::string& timestamp) {
  json obj = page_stats_to_json(stats);
  obj["timestamp"] = timestamp;
  return obj.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace bqa
