#include "bqa_page_pipeline.h"
#include "../bounds/bqa_boundary_validator.h"
#include "../stats/bqa_layout_statistics.h"
#include "../../utils/bqa_exceptions.h"
#include "../../utils/bqa_log.h"
#include "../../utils/bqa_string_utils.h"
#include <utility>

namespace bqa {

void bqa_batch_totals::add(const bqa_page_report& report) {
  total_lines += report.validation.total_lines;
  out_of_bounds_lines += report.validation.out_of_bounds_lines.size();
  out_of_bounds_paragraphs += report.validation.out_of_bounds_paragraphs.size();
  out_of_bounds_regions += report.validation.out_of_bounds_regions.size();
  ++total_pages;
}

void bqa_batch_totals::merge(const bqa_batch_totals& other) {
  total_lines += other.total_lines;
  out_of_bounds_lines += other.out_of_bounds_lines;
  out_of_bounds_paragraphs += other.out_of_bounds_paragraphs;
  out_of_bounds_regions += other.out_of_bounds_regions;
  total_pages += other.total_pages;
  skipped_pages += other.skipped_pages;
}

bqa_page_pipeline::bqa_page_pipeline(bqa_pipeline_options options)
  : options_(std::move(options))
{
}

void bqa_page_pipeline::patch_gallica_link(bqa_page& page) const {
  if (!page.iiif_img_base_uri) {
    return;
  }
  if (replace_prefix(*page.iiif_img_base_uri, gallica_iiif_prefix, gallica_iiif_v3_prefix)) {
    BQA_LOG_INFO("pipeline") << "Patched IIIF link for page " << page.id << " to " << *page.iiif_img_base_uri;
  }
}

std::optional<bqa_page_report> bqa_page_pipeline::process_page(bqa_page& page, i_dimension_provider& provider) {
  if (options_.iiif_gallica_v3) {
    patch_gallica_link(page);
  }

  std::optional<std::string> image_ref = page.image_ref();
  if (!image_ref) {
    BQA_LOG_ERROR("pipeline") << "No IIIF base URI found for page " << page.id << ".";
    return std::nullopt;
  }

  bqa_page_report report;
  report.page_id = page.id;
  report.ts = options_.timestamp;
  report.iiif_base_uri = *image_ref;
  report.cc_json = page.cc_json;
  report.git_version = options_.git_version;

  try {
    std::optional<bqa_image_size> size = provider.resolve_dimensions(*image_ref);
    if (!size) {
      BQA_LOG_ERROR("pipeline") << "Could not determine image dimensions for " << page.id;
      return std::nullopt;
    }
    report.facsimile = *size;
    BQA_LOG_INFO("pipeline") << "Retrieved IIIF for " << page.id << " from " << *image_ref;
  } catch (const bqa_dimension_error& e) {
    BQA_LOG_ERROR("pipeline") << "Failed to fetch image dimensions for " << page.id << ": " << e.what();
    report.facsimile.width = sentinel_dimension;
    report.facsimile.height = sentinel_dimension;
    report.error = e.what();
  }

  report.validation = bqa_boundary_validator::validate(page,
                                                       static_cast<double>(report.facsimile.width),
                                                       static_cast<double>(report.facsimile.height));
  report.pages_stats = bqa_layout_statistics::compute(page);
  return report;
}

bqa_batch_totals bqa_page_pipeline::run(i_page_source& source, i_dimension_provider& provider, i_report_sink& sink) {
  BQA_LOG_INFO("pipeline") << "Starting line boundary check...";
  bqa_batch_totals totals;

  bqa_page page;
  while (source.next(page)) {
    std::optional<bqa_page_report> report = process_page(page, provider);
    if (!report) {
      totals.add_skipped();
      continue;
    }
    sink.write(*report);
    totals.add(*report);
  }

  log_summary(totals);
  return totals;
}

void bqa_page_pipeline::log_summary(const bqa_batch_totals& totals) {
  BQA_LOG_INFO("pipeline") << "Batch summary: " << totals.total_lines << " lines, "
                           << totals.out_of_bounds_lines << " out-of-bounds lines, "
                           << totals.out_of_bounds_paragraphs << " out-of-bounds paragraphs, "
                           << totals.out_of_bounds_regions << " out-of-bounds regions, "
                           << totals.total_out_of_bounds() << " total out-of-bounds, "
                           << totals.total_pages << " total pages";
  if (totals.skipped_pages > 0) {
    BQA_LOG_WARNING("pipeline") << totals.skipped_pages << " page(s) skipped";
  }
}

} // namespace bqa
