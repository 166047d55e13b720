#include "crawl_coordinator.hpp"
#include "crawl_report.hpp"
#include "crawler_config.hpp"
#include "http_client.hpp"
#include "logger.hpp"
#include "page_fetcher.hpp"
#include "result_store.hpp"
#include "duckdb.hpp"

#include <boost/program_options.hpp>

#include <exception>
#include <iostream>
#include <string>

namespace po = boost::program_options;
using namespace webcrawl;

static void PrintUsage(const po::options_description &desc) {
	std::cout << "Usage: crawl <base_url> [options]\n" << desc << "\n";
}

int main(int argc, char *argv[]) {
	CrawlerConfig config;
	std::string base_url;
	std::string log_level;

	po::options_description desc("Allowed options");
	desc.add_options()
		("help,h", "produce help message")
		("max-depth", po::value<int>(&config.max_depth)->default_value(config.max_depth),
		 "maximum link depth from the seed")
		("max-pages", po::value<int>(&config.max_pages)->default_value(config.max_pages),
		 "maximum number of pages to process")
		("num-threads", po::value<int>(&config.num_threads)->default_value(config.num_threads),
		 "number of concurrent workers")
		("database", po::value<std::string>(&config.database_path)->default_value(config.database_path),
		 "DuckDB database file (\":memory:\" for none)")
		("output,o", po::value<std::string>(&config.output_path), "write the JSON report to this file")
		("store-content", po::value<bool>(&config.store_content)->default_value(config.store_content),
		 "keep the body of successful pages in the pages table")
		("user-agent", po::value<std::string>(&config.user_agent)->default_value(config.user_agent),
		 "User-Agent header")
		("timeout-ms", po::value<int64_t>(&config.timeout_ms)->default_value(config.timeout_ms),
		 "per-request timeout in milliseconds")
		("max-response-bytes",
		 po::value<int64_t>(&config.max_response_bytes)->default_value(config.max_response_bytes),
		 "largest response body to accept")
		("allow-external", "follow links to other hosts")
		("allow-subdomains", "treat subdomains of the seed host as the same site")
		("respect-nofollow", "honor rel=\"nofollow\" and <meta name=\"robots\" content=\"nofollow\">")
		("max-retries", po::value<int>(&config.retry.max_retries)->default_value(config.retry.max_retries),
		 "retries for network errors, 429 and 5xx")
		("accept-content-types",
		 po::value<std::string>(&config.accept_content_types)->default_value(config.accept_content_types),
		 "comma-separated content types to parse (wildcards like text/*)")
		("log-level", po::value<std::string>(&log_level)->default_value("info"),
		 "debug, info, warn, error or off");

	po::options_description hidden("Hidden options");
	hidden.add_options()
		("base-url", po::value<std::string>(&base_url), "seed URL");

	po::options_description all("All options");
	all.add(desc).add(hidden);

	po::positional_options_description positional;
	positional.add("base-url", 1);

	po::variables_map vm;
	try {
		po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
		po::notify(vm);
	} catch (po::error &e) {
		std::cerr << "crawl: " << e.what() << "\n";
		PrintUsage(desc);
		return 1;
	}

	if (vm.count("help")) {
		PrintUsage(desc);
		return 0;
	}
	if (base_url.empty()) {
		std::cerr << "crawl: missing <base_url>\n";
		PrintUsage(desc);
		return 1;
	}

	LogLevel level;
	if (!Logger::ParseLevel(log_level, level)) {
		std::cerr << "crawl: unknown log level '" << log_level << "'\n";
		return 1;
	}
	Logger::SetLevel(level);

	if (vm.count("allow-external")) {
		config.domain_policy = DomainPolicy::ANY_DOMAIN;
	}
	config.allow_subdomains = vm.count("allow-subdomains") > 0;
	config.respect_nofollow = vm.count("respect-nofollow") > 0;

	try {
		config.Validate();
		// Before the database file is created or extended
		CrawlCoordinator::CheckSeed(base_url);
		DuckDBResultStore store(config.database_path);
		Logger::Info("Recording results in " + config.database_path + " (run " + std::to_string(store.RunId()) + ")");

		InitializeHttpClient();
		CrawlReport report;
		{
			CurlPageFetcher fetcher(config);
			CrawlCoordinator coordinator(config, fetcher, store);
			CrawlCoordinator::InstallSignalHandler();
			try {
				report = coordinator.Run(base_url);
			} catch (std::exception &) {
				CleanupHttpClient();
				throw;
			}
		}
		CleanupHttpClient();

		WriteReport(report, config.output_path);
	} catch (duckdb::Exception &e) {
		Logger::Error(e.what());
		return 1;
	} catch (std::exception &e) {
		Logger::Error(std::string("Fatal: ") + e.what());
		return 1;
	}
	return 0;
}
