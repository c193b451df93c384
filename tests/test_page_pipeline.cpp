#include <catch2/catch_all.hpp>
#include "../qaprocesses/pipeline/bqa_page_pipeline.h"
#include "../api/json/bqa_json.h"
#include "../utils/bqa_exceptions.h"

using namespace bqa;

// ============================================================================
// MOCKS - dimension provider, page source and report sink
// ============================================================================

class mock_dimension_provider : public i_dimension_provider {
private:
  std::optional<bqa_image_size> size_;
  bool fail_;
  std::vector<std::string> requests_;

public:
  mock_dimension_provider() : fail_(false) {}

  void set_size(long long width, long long height) { size_ = bqa_image_size{width, height}; }
  void set_unknown() { size_.reset(); }
  void set_failing(bool fail) { fail_ = fail; }
  const std::vector<std::string>& get_requests() const { return requests_; }

  std::optional<bqa_image_size> resolve_dimensions(const std::string& image_ref) override {
    requests_.push_back(image_ref);
    if (fail_) {
      throw bqa_dimension_error("Read timed out", image_ref, 5);
    }
    return size_;
  }
};

class vector_page_source : public i_page_source {
private:
  std::vector<bqa_page> pages_;
  size_t index_ = 0;

public:
  explicit vector_page_source(std::vector<bqa_page> pages) : pages_(std::move(pages)) {}

  bool next(bqa_page& page) override {
    if (index_ >= pages_.size()) {
      return false;
    }
    page = pages_[index_++];
    return true;
  }
};

class collecting_sink : public i_report_sink {
public:
  std::vector<bqa_page_report> reports;

  void write(const bqa_page_report& report) override {
    reports.push_back(report);
  }
};

namespace {

// One region, one paragraph, two lines; the second line ends at y = 130.
bqa_page make_page(const std::string& id, const std::string& image_ref) {
  bqa_page page = bqa_json::parse_page(R"({"id": "placeholder", "cc": true, "r": [
      {"c": [0, 0, 200, 100], "p": [
          {"c": [10, 10, 100, 50], "l": [
              {"c": [10, 10, 100, 50], "t": [{"tx": "Genève"}]},
              {"c": [10, 80, 100, 50], "t": [{"tx": "Lausanne"}]}
          ]}
      ]}
  ]})");
  page.id = id;
  if (!image_ref.empty()) {
    page.iiif_img_base_uri = image_ref;
  }
  return page;
}

bqa_pipeline_options default_options() {
  bqa_pipeline_options options;
  options.timestamp = "2024-05-01T12:30:00Z";
  return options;
}

} // namespace

SCENARIO("bqa_page_pipeline processes a single page") {
    GIVEN("A provider that knows the image size") {
        mock_dimension_provider provider;
        provider.set_size(200, 100);
        bqa_pipeline_options options = default_options();
        options.git_version = std::string("v2.0.1");
        bqa_page_pipeline pipeline(options);
        bqa_page page = make_page("JDG-1900-01-02-a-p0001", "https://img/p1");

        WHEN("The page is processed") {
            auto report = pipeline.process_page(page, provider);

            THEN("A full report is produced") {
                REQUIRE(report.has_value());
                REQUIRE(report->page_id == "JDG-1900-01-02-a-p0001");
                REQUIRE(report->ts == "2024-05-01T12:30:00Z");
                REQUIRE(report->facsimile.width == 200);
                REQUIRE(report->facsimile.height == 100);
                REQUIRE(report->iiif_base_uri == "https://img/p1");
                REQUIRE(report->cc_json == std::optional<std::string>("true"));
                REQUIRE(report->git_version == std::optional<std::string>("v2.0.1"));
                REQUIRE_FALSE(report->error.has_value());
            }

            THEN("Validation and statistics are included") {
                REQUIRE(report->validation.total_lines == 2);
                REQUIRE(report->validation.out_of_bounds_lines.size() == 1);
                REQUIRE(report->validation.out_of_bounds_lines[0].excess.height == 30);
                REQUIRE(report->pages_stats.num_lines == 2);
                REQUIRE(report->pages_stats.num_empty_lines == 0);
            }
        }
    }

    GIVEN("A provider that fails") {
        mock_dimension_provider provider;
        provider.set_failing(true);
        bqa_page_pipeline pipeline(default_options());
        bqa_page page = make_page("p", "https://img/p");

        WHEN("The page is processed") {
            auto report = pipeline.process_page(page, provider);

            THEN("The sentinel size is used and the error is recorded") {
                REQUIRE(report.has_value());
                REQUIRE(report->facsimile.width == bqa_page_pipeline::sentinel_dimension);
                REQUIRE(report->facsimile.height == 999999);
                REQUIRE(report->error == std::optional<std::string>("Read timed out"));
                REQUIRE(report->validation.total_lines == 2);
                REQUIRE(report->validation.out_of_bounds_lines.empty());
            }
        }
    }

    GIVEN("A provider that cannot tell the size") {
        mock_dimension_provider provider;
        provider.set_unknown();
        bqa_page_pipeline pipeline(default_options());
        bqa_page page = make_page("p", "https://gallica.bnf.fr/iiif/ark:/12148/x/f9");

        THEN("The page is skipped") {
            REQUIRE_FALSE(pipeline.process_page(page, provider).has_value());
            REQUIRE(provider.get_requests().size() == 1);
        }
    }

    GIVEN("A page without image reference") {
        mock_dimension_provider provider;
        provider.set_size(10, 10);
        bqa_page_pipeline pipeline(default_options());
        bqa_page page = make_page("p", "");

        THEN("The page is skipped without asking the provider") {
            REQUIRE_FALSE(pipeline.process_page(page, provider).has_value());
            REQUIRE(provider.get_requests().empty());
        }
    }

    GIVEN("A page whose primary reference is empty while the fallback is set") {
        mock_dimension_provider provider;
        provider.set_size(200, 100);
        bqa_page_pipeline pipeline(default_options());
        bqa_page page = make_page("p", "");
        page.iiif_img_base_uri = std::string();
        page.iiif = std::string("https://img/fallback");

        THEN("The page is skipped without asking the provider") {
            REQUIRE_FALSE(pipeline.process_page(page, provider).has_value());
            REQUIRE(provider.get_requests().empty());
        }
    }

    GIVEN("A page with only the fallback reference") {
        mock_dimension_provider provider;
        provider.set_size(200, 100);
        bqa_page_pipeline pipeline(default_options());
        bqa_page page = make_page("p", "");
        page.iiif = std::string("https://img/fallback");

        THEN("The fallback is used for lookup and report") {
            auto report = pipeline.process_page(page, provider);
            REQUIRE(report.has_value());
            REQUIRE(provider.get_requests()[0] == "https://img/fallback");
            REQUIRE(report->iiif_base_uri == "https://img/fallback");
        }
    }
}

SCENARIO("bqa_page_pipeline rewrites Gallica links on request") {
    GIVEN("A page with a Gallica IIIF link") {
        mock_dimension_provider provider;
        provider.set_size(2000, 3000);
        bqa_page page = make_page("p", "https://gallica.bnf.fr/iiif/ark:/12148/bpt6k123/f2");

        WHEN("The v3 option is set") {
            bqa_pipeline_options options = default_options();
            options.iiif_gallica_v3 = true;
            bqa_page_pipeline pipeline(options);
            auto report = pipeline.process_page(page, provider);

            THEN("The link points at the v3 endpoint") {
                const std::string expected = "https://openapi.bnf.fr/iiif/presentation/v3/ark:/12148/bpt6k123/f2";
                REQUIRE(provider.get_requests()[0] == expected);
                REQUIRE(report->iiif_base_uri == expected);
            }
        }

        WHEN("The v3 option is not set") {
            bqa_page_pipeline pipeline(default_options());
            pipeline.process_page(page, provider);

            THEN("The link is unchanged") {
                REQUIRE(provider.get_requests()[0] == "https://gallica.bnf.fr/iiif/ark:/12148/bpt6k123/f2");
            }
        }
    }
}

SCENARIO("bqa_page_pipeline runs a batch") {
    GIVEN("Three pages, one without image reference") {
        mock_dimension_provider provider;
        provider.set_size(200, 100);
        vector_page_source source({make_page("a", "https://img/a"),
                                   make_page("b", ""),
                                   make_page("c", "https://img/c")});
        collecting_sink sink;
        bqa_page_pipeline pipeline(default_options());

        WHEN("The batch is run") {
            bqa_batch_totals totals = pipeline.run(source, provider, sink);

            THEN("Reports are written for the processed pages only") {
                REQUIRE(sink.reports.size() == 2);
                REQUIRE(sink.reports[0].page_id == "a");
                REQUIRE(sink.reports[1].page_id == "c");
            }

            THEN("Totals sum the processed pages") {
                REQUIRE(totals.total_pages == 2);
                REQUIRE(totals.skipped_pages == 1);
                REQUIRE(totals.total_lines == 4);
                REQUIRE(totals.out_of_bounds_lines == 2);
                REQUIRE(totals.out_of_bounds_paragraphs == 0);
                REQUIRE(totals.out_of_bounds_regions == 0);
                REQUIRE(totals.total_out_of_bounds() == 2);
            }
        }
    }

    GIVEN("A batch containing a page without regions") {
        mock_dimension_provider provider;
        provider.set_size(200, 100);
        bqa_page broken;
        broken.id = "broken";
        broken.iiif_img_base_uri = std::string("https://img/broken");
        vector_page_source source({make_page("a", "https://img/a"), broken});
        collecting_sink sink;
        bqa_page_pipeline pipeline(default_options());

        THEN("The schema error ends the run") {
            REQUIRE_THROWS_AS(pipeline.run(source, provider, sink), bqa_schema_error);
            REQUIRE(sink.reports.size() == 1);
        }
    }
}

SCENARIO("bqa_batch_totals are additive") {
    GIVEN("Totals from two partial runs") {
        bqa_batch_totals first;
        first.total_lines = 10;
        first.out_of_bounds_lines = 2;
        first.out_of_bounds_regions = 1;
        first.total_pages = 3;
        first.add_skipped();

        bqa_batch_totals second;
        second.total_lines = 5;
        second.out_of_bounds_paragraphs = 4;
        second.total_pages = 1;

        WHEN("They are merged in either order") {
            bqa_batch_totals ab = first;
            ab.merge(second);
            bqa_batch_totals ba = second;
            ba.merge(first);

            THEN("The results agree") {
                REQUIRE(ab.total_lines == 15);
                REQUIRE(ab.total_out_of_bounds() == 7);
                REQUIRE(ab.total_pages == 4);
                REQUIRE(ab.skipped_pages == 1);
                REQUIRE(ba.total_lines == ab.total_lines);
                REQUIRE(ba.out_of_bounds_lines == ab.out_of_bounds_lines);
                REQUIRE(ba.out_of_bounds_paragraphs == ab.out_of_bounds_paragraphs);
                REQUIRE(ba.out_of_bounds_regions == ab.out_of_bounds_regions);
                REQUIRE(ba.skipped_pages == ab.skipped_pages);
            }
        }
    }
}
