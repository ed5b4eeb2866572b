#include "core/deeplink_config.hpp"
#include "core/errors.hpp"
#include "core/media_handler.hpp"
#include "database/token_registry.hpp"
#include "logging/logger.hpp"
#include "pipeline/processing_pipeline.hpp"
#include "service/delivery_gate.hpp"
#include "service/ingestion_coordinator.hpp"
#include "transfer/transfer_manager.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace
{
    const char *const DEFAULT_CONFIG = "config/deeplink.json";

    void printUsage(const char *program)
    {
        std::cout << "Usage: " << program << " [-c config.json] [--log-level LEVEL] <command> [args]" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  ingest <video|photo> <path|url> [options]  Register an upload and print its token" << std::endl;
        std::cout << "      --size BYTES          Declared size of a remote source" << std::endl;
        std::cout << "      --preview SECONDS     Preview length (enables preview)" << std::endl;
        std::cout << "      --no-preview" << std::endl;
        std::cout << "      --collage FRAMES      Collage frame count: 4, 6, 9 or 12 (enables collage)" << std::endl;
        std::cout << "      --no-collage" << std::endl;
        std::cout << "      --watermark TEXT      Watermark text (enables watermark)" << std::endl;
        std::cout << "      --position ANCHOR     e.g. center, bottom-right" << std::endl;
        std::cout << "      --opacity VALUE       0.1 to 1.0" << std::endl;
        std::cout << "      --target STAGE        raw, preview or collage" << std::endl;
        std::cout << "      --protect / --no-protect" << std::endl;
        std::cout << "      --no-wait             Exit without waiting for processing" << std::endl;
        std::cout << "  resolve <token> [--output FILE]            Show (or copy) the delivered artifact" << std::endl;
        std::cout << "  list                                       List stored tokens" << std::endl;
        std::cout << "  delete <token>                             Delete a token and its artifacts" << std::endl;
        std::cout << "  status <token>                             Show per-stage job state" << std::endl;
        std::cout << "  set-config <key> <json-value>              Persist a configuration value" << std::endl;
    }

    // "--flag value" pairs and bare "--flag" switches after the positional arguments
    std::map<std::string, std::string> parseOptions(const std::vector<std::string> &args, size_t first)
    {
        std::map<std::string, std::string> options;
        for (size_t i = first; i < args.size(); ++i)
        {
            const std::string &arg = args[i];
            if (arg.rfind("--", 0) != 0)
                throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Unexpected argument: " + arg);

            bool has_value = i + 1 < args.size() && args[i + 1].rfind("--", 0) != 0;
            options[arg] = has_value ? args[++i] : "";
        }
        return options;
    }

    double parseDouble(const std::string &flag, const std::string &value)
    {
        try
        {
            return std::stod(value);
        }
        catch (const std::exception &)
        {
            throw DeepLinkError(ErrorCode::VALIDATION_ERROR, flag + " expects a number, got '" + value + "'");
        }
    }

    uint64_t parseUnsigned(const std::string &flag, const std::string &value)
    {
        try
        {
            return std::stoull(value);
        }
        catch (const std::exception &)
        {
            throw DeepLinkError(ErrorCode::VALIDATION_ERROR, flag + " expects an integer, got '" + value + "'");
        }
    }

    UploadRequest buildUploadRequest(const std::vector<std::string> &args, bool &wait)
    {
        if (args.size() < 3)
            throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "ingest needs <kind> <source>");

        UploadRequest request;
        request.kind = args[1];
        request.source.reference = args[2];

        auto options = parseOptions(args, 3);
        ProcessingOptions &opts = request.options;
        for (const auto &[flag, value] : options)
        {
            if (flag == "--size")
                request.source.size_bytes = parseUnsigned(flag, value);
            else if (flag == "--preview")
            {
                opts.generate_preview = true;
                opts.preview_length_seconds = parseDouble(flag, value);
            }
            else if (flag == "--no-preview")
                opts.generate_preview = false;
            else if (flag == "--collage")
            {
                opts.generate_collage = true;
                opts.collage_frames = static_cast<int>(parseUnsigned(flag, value));
            }
            else if (flag == "--no-collage")
                opts.generate_collage = false;
            else if (flag == "--watermark")
            {
                opts.apply_watermark = true;
                opts.watermark_text = value;
            }
            else if (flag == "--position")
                opts.watermark_position = value;
            else if (flag == "--opacity")
                opts.watermark_opacity = parseDouble(flag, value);
            else if (flag == "--target")
                opts.watermark_target = value;
            else if (flag == "--protect")
                opts.content_protection = true;
            else if (flag == "--no-protect")
                opts.content_protection = false;
            else if (flag == "--no-wait")
                wait = false;
            else
                throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Unknown ingest option: " + flag);
        }
        return request;
    }

    int runCommand(const std::vector<std::string> &args, DeepLinkConfig &config, TokenRegistry &registry,
                   ProcessingPipeline &pipeline, IngestionCoordinator &ingestion, DeliveryGate &gate)
    {
        const std::string &command = args[0];

        if (command == "ingest")
        {
            bool wait = true;
            UploadRequest request = buildUploadRequest(args, wait);
            std::string token = ingestion.ingest(request);
            std::cout << token << std::endl;

            if (wait)
            {
                auto limit = std::chrono::seconds(config.getStageTimeoutSeconds() + config.getSessionTimeoutSeconds());
                if (!pipeline.waitIdle(std::chrono::duration_cast<std::chrono::milliseconds>(limit)))
                    Logger::warn("Processing still running for " + token);
            }
            return 0;
        }

        if (command == "resolve")
        {
            if (args.size() < 2)
                throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "resolve needs <token>");
            auto options = parseOptions(args, 2);
            ResolveResult result = gate.resolve(args[1]);

            std::cout << "storage: " << result.storage_ref << std::endl;
            std::cout << "stage: " << (result.stage ? MediaTypes::getStageName(*result.stage) : "raw") << std::endl;
            std::cout << "kind: " << MediaTypes::getKindName(result.kind) << std::endl;
            std::cout << "protected: " << (result.content_protection ? "yes" : "no") << std::endl;

            auto output = options.find("--output");
            if (output != options.end())
            {
                auto in = result.openStream();
                std::ofstream out(output->second, std::ios::binary);
                out << in->rdbuf();
                if (!out)
                    throw DeepLinkError(ErrorCode::FATAL, "Could not write " + output->second);
                std::cout << "written: " << output->second << std::endl;
            }
            return 0;
        }

        if (command == "list")
        {
            auto cursor = registry.list();
            size_t count = 0;
            while (auto descriptor = cursor.next())
            {
                std::cout << descriptor->token << "  " << MediaTypes::getKindName(descriptor->kind) << "  "
                          << descriptor->source_ref << std::endl;
                ++count;
            }
            std::cout << count << " stored" << std::endl;
            return 0;
        }

        if (command == "delete")
        {
            if (args.size() < 2)
                throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "delete needs <token>");
            ingestion.remove(DeleteRequest{args[1]});
            std::cout << "deleted " << args[1] << std::endl;
            return 0;
        }

        if (command == "status")
        {
            if (args.size() < 2)
                throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "status needs <token>");
            auto snapshots = ingestion.jobStatus(args[1]);
            if (snapshots.empty())
                std::cout << "no stages recorded" << std::endl;
            for (const auto &snap : snapshots)
            {
                std::cout << MediaTypes::getStageName(snap.stage) << ": " << ProcessingJob::getStateName(snap.state);
                if (snap.artifact)
                    std::cout << " (" << MediaTypes::getStatusName(snap.artifact->status) << ")";
                if (!snap.error_message.empty())
                    std::cout << " - " << snap.error_message;
                std::cout << std::endl;
            }
            return 0;
        }

        if (command == "set-config")
        {
            if (args.size() < 3)
                throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "set-config needs <key> <json-value>");
            if (!config.setValue(args[1], args[2]))
                throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Unknown configuration key: " + args[1]);
            registry.setConfigValue(args[1], args[2]);
            std::cout << args[1] << " = " << args[2] << std::endl;
            return 0;
        }

        throw DeepLinkError(ErrorCode::VALIDATION_ERROR, "Unknown command: " + command);
    }
}

int main(int argc, char *argv[])
{
    Logger::init("INFO");

    std::string config_path;
    std::string log_level;
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc)
            config_path = argv[++i];
        else if (arg == "--log-level" && i + 1 < argc)
            log_level = argv[++i];
        else if (arg == "-h" || arg == "--help")
        {
            printUsage(argv[0]);
            return 0;
        }
        else
            args.push_back(arg);
    }

    if (args.empty())
    {
        printUsage(argv[0]);
        return 2;
    }
    if (!log_level.empty() && !Logger::isValidLevel(log_level))
    {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return 2;
    }

    DeepLinkConfig config;
    if (!config_path.empty())
    {
        if (!config.load(config_path))
            return 2;
    }
    else if (std::filesystem::exists(DEFAULT_CONFIG) && !config.load(DEFAULT_CONFIG))
    {
        Logger::warn(std::string("Ignoring unreadable ") + DEFAULT_CONFIG + ", using defaults");
    }

    try
    {
        TokenRegistry registry(config.getDatabasePath());
        config.overlay(registry.getConfigValues());
        Logger::setLevel(log_level.empty() ? config.getLogLevel() : log_level);

        TransferManager transfers(TransferOptions::fromConfig(config), config.getTempDir());
        ProcessingPipeline pipeline(config, registry, transfers, MediaHandlers::defaults());
        IngestionCoordinator ingestion(config, registry, pipeline);
        DeliveryGate gate(config, registry, transfers);

        int status = runCommand(args, config, registry, pipeline, ingestion, gate);
        Logger::flush();
        return status;
    }
    catch (const DeepLinkError &e)
    {
        Logger::error(e.what());
        std::cerr << e.what() << std::endl;
        return e.code() == ErrorCode::VALIDATION_ERROR ? 2 : 1;
    }
    catch (const std::exception &e)
    {
        Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "FATAL: " << e.what() << std::endl;
        return 1;
    }
}
