/**
 * \file worker/workerMain.cpp
 * \brief Entrypoint for the worker process: options, capability lookup, worker pool.
 */

#include "pool/WorkerPool.hpp"
#include "WorkerOptions.hpp"
#include "capabilities/registry/CapabilityRegistry.hpp"
#include "logger.hpp"
#include <options/Options.hpp>
#include <processUtils.hpp>
#include <iostream>

/** \brief Entrypoint for the worker binary. */
int main(int argc, char* argv[]) {
    try {
        std::string opt_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opt_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0;
        }
        if (parse_res == shared_opts::Options::ParseResult::Error) {
            std::cerr << "worker option parse error: " << opt_err << std::endl;
            return 2;
        }

        namespace wo = CortexWorker::worker_opts;
        CortexWorker::WorkerConfiguration config;
        try {
            config = wo::build_configuration();
        } catch (const std::invalid_argument& e) {
            std::cerr << "worker option parse error: " << e.what() << std::endl;
            return 2;
        }

        // Setup logger
        auto logger = std::make_shared<Logger>("Worker");
        auto stdout_sink = std::make_shared<StdoutSink>();
        stdout_sink->set_level(wo::get_log_level().value_or(LogLevel::Info));
        logger->add_sink(stdout_sink);

        auto& registry = CortexWorker::Capabilities::CapabilityRegistry::instance();
        registry.set_logger(logger);
        if (!registry.has_capability(config.capability)) {
            std::string known;
            for (const auto& n : registry.names()) known += (known.empty() ? "" : ", ") + n;
            logger->error("unknown capability '" + config.capability + "' (registered: " + known + ")");
            return 2;
        }
        if (config.service.empty()) {
            config.service = registry.default_service(config.capability).value_or(config.capability);
        }
        config.validate();

        std::shared_ptr<const CortexWorker::Capabilities::IConversionCapability> capability =
            registry.create(config.capability, config, logger);
        if (!capability) {
            logger->error("capability '" + config.capability + "' could not be created");
            return 1;
        }
        logger->info("capability " + std::string{capability->name()} + " serving " + config.service);

        CortexWorker::WorkerPool pool(config, capability, ProcessUtils::get_host_name(), logger);
        auto report = pool.run();
        for (const auto& failure : report.failures) {
            logger->error("worker " + failure.identity + " failed: " + failure.message);
        }
        return report.ok() ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "worker error: " << e.what() << std::endl;
        return 1;
    }
}
