#include "api/client/bqa_http_client.h"
#include "api/client/bqa_http_request.h"
#include "api/iiif/bqa_dimension_resolver.h"
#include "documents/io/bqa_page_source.h"
#include "documents/io/bqa_report_writer.h"
#include "qaprocesses/pipeline/bqa_page_pipeline.h"
#include "utils/bqa_config.h"
#include "utils/bqa_env.h"
#include "utils/bqa_exceptions.h"
#include "utils/bqa_log.h"
#include "utils/bqa_timestamp.h"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace bqa;

int main(int argc, char *argv[])
{
  load_env_file(".env");

  std::vector<std::string> args;
  for (int i = 1; i < argc; i++)
  {
    args.push_back(argv[i]);
  }

  bqa_check_config config;
  try
  {
    config = bqa_check_config::parse(args);
    if (config.show_help)
    {
      std::cout << bqa_check_config::usage(argv[0]);
      return 0;
    }
    apply_log_config(config.log);
  }
  catch (const bqa_config_error& e)
  {
    std::cerr << e.what() << "\n\n" << bqa_check_config::usage(argv[0]);
    return 2;
  }

  bqa_http_global http_global;
  std::unique_ptr<bqa_page_source> source;

  try
  {
    auto client = std::make_shared<bqa_curl_http_client>();
    bqa_dimension_resolver resolver(client);
    resolver.iiif().set_timeout_base_seconds(config.http_timeout_base);

    source = std::make_unique<bqa_page_source>(config.input, config.random);

    bqa_report_writer writer(config.output);

    bqa_pipeline_options options;
    options.timestamp = get_timestamp();
    options.git_version = config.git_version;
    options.iiif_gallica_v3 = config.iiif_gallica_v3;

    bqa_page_pipeline pipeline(options);
    pipeline.run(*source, resolver, writer);

    BQA_LOG_INFO("main") << "Wrote " << writer.written() << " report(s) to " << config.output;
    BQA_LOG_INFO("main") << "Finished processing all pages.";
  }
  catch (const bqa_exception& e)
  {
    if (source)
    {
      BQA_LOG_ERROR("main") << "Processing failed at " << source->position() << ": " << e.what();
    }
    else
    {
      BQA_LOG_ERROR("main") << "Processing failed: " << e.what();
    }
    return 1;
  }
  catch (const std::exception& e)
  {
    BQA_LOG_ERROR("main") << "Unexpected error: " << e.what();
    return 2;
  }

  return 0;
}
