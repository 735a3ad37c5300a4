#include <signal.h>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <cxxopts.hpp>
#include <mw/error.hpp>
#include <mw/http_client.hpp>
#include <mw/utils.hpp>
#include <spdlog/spdlog.h>

#include "app.hpp"
#include "config.hpp"
#include "crypto.hpp"
#include "database.hpp"
#include "signature_codec.hpp"

namespace {

constexpr int PURGE_INTERVAL_SECONDS = 60;

std::string readKeyFile(const std::string& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if(!f)
    {
        throw std::runtime_error("Cannot open key file: " + path);
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::optional<SignatureAlgorithm> algorithmOption(const cxxopts::ParseResult& opts)
{
    std::string alg = opts["alg"].as<std::string>();
    auto parsed = algorithmFromStr(alg);
    if(!parsed.has_value())
    {
        spdlog::error("Unsupported algorithm: {}", alg);
    }
    return parsed;
}

int runKeygen(const cxxopts::ParseResult& opts)
{
    auto alg = algorithmOption(opts);
    if(!alg.has_value())
    {
        return 1;
    }
    auto keys = Crypto().generateKeyPair(*alg);
    if(!keys.has_value())
    {
        spdlog::error("Failed to generate key pair: {}",
                      mw::errorMsg(keys.error()));
        return 1;
    }
    std::cout << keys->public_key << keys->private_key;
    return 0;
}

int runSign(const cxxopts::ParseResult& opts)
{
    for(const char* required : {"key", "agent", "authority", "path"})
    {
        if(opts.count(required) == 0)
        {
            spdlog::error("Option --{} is required to sign", required);
            return 1;
        }
    }
    auto alg = algorithmOption(opts);
    if(!alg.has_value())
    {
        return 1;
    }

    int64_t now = mw::timeToSeconds(mw::Clock::now());
    SignatureContext ctx;
    ctx.agent_id = opts["agent"].as<std::string>();
    ctx.key_id = opts["key-id"].as<std::string>();
    ctx.alg = algorithmName(*alg);
    ctx.tag = opts["tag"].as<std::string>();
    ctx.created = now;
    ctx.expires = now + opts["window"].as<int>();
    if(opts.count("nonce") > 0)
    {
        ctx.nonce = opts["nonce"].as<std::string>();
    }
    else
    {
        auto nonce = uuid4();
        if(!nonce.has_value())
        {
            spdlog::error("Failed to make nonce: {}",
                          mw::errorMsg(nonce.error()));
            return 1;
        }
        ctx.nonce = *nonce;
    }

    RequestContext req;
    req.authority = opts["authority"].as<std::string>();
    req.path = opts["path"].as<std::string>();

    std::string private_key = readKeyFile(opts["key"].as<std::string>());
    auto headers = signature_codec::sign(ctx, req, private_key, Crypto());
    if(!headers.has_value())
    {
        spdlog::error("Failed to sign: {}", mw::errorMsg(headers.error()));
        return 1;
    }
    std::cout << "Signature-Agent: " << headers->signature_agent << "\n"
              << "Signature-Input: " << headers->signature_input << "\n"
              << "Signature: " << headers->signature << std::endl;
    return 0;
}

mw::E<void> seedCatalog(DatabaseInterface& db)
{
    ASSIGN_OR_RETURN(int64_t count, db.countProducts());
    if(count > 0)
    {
        return {};
    }
    for(const Product& p : Config::get().catalog)
    {
        DO_OR_RETURN(db.createProduct(p));
    }
    if(!Config::get().catalog.empty())
    {
        spdlog::info("Added {} products to the catalog",
                     Config::get().catalog.size());
    }
    return {};
}

void reloadTrustedAgents(App& app, const std::string& config_file)
{
    if(config_file.empty())
    {
        spdlog::warn("No config file to reload");
        return;
    }
    try
    {
        Config fresh;
        fresh.load(config_file);
        app.keyStore().replace(fresh.trusted_agents);
    }
    catch(const std::exception& e)
    {
        spdlog::error("Failed to reload {}, keeping current keys: {}",
                      config_file, e.what());
    }
}

int runServe(const std::string& config_file)
{
    auto db = std::make_unique<Database>(Config::get().db_path);
    auto init = db->init();
    if(!init.has_value())
    {
        spdlog::error("Failed to open database {}: {}", Config::get().db_path,
                      mw::errorMsg(init.error()));
        return 1;
    }
    auto seeded = seedCatalog(*db);
    if(!seeded.has_value())
    {
        spdlog::error("Failed to seed catalog: {}",
                      mw::errorMsg(seeded.error()));
        return 1;
    }

    // Handle signals on this thread only. Server threads inherit the
    // mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGHUP);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    mw::HTTPServer::ListenAddress listen = mw::IPSocketInfo{
        Config::get().listen_address, Config::get().port};
    App app(std::move(db), listen, std::make_unique<mw::HTTPSession>());
    auto started = app.start();
    if(!started.has_value())
    {
        spdlog::error("Failed to start server: {}",
                      mw::errorMsg(started.error()));
        return 1;
    }
    spdlog::info("Listening at http://{}:{}/ with {} trusted agents",
                 Config::get().listen_address, Config::get().port,
                 app.keyStore().size());
    if(!Config::get().require_agent_signature)
    {
        spdlog::warn("Agent signatures are not required on x402 checkout; "
                     "set require_agent_signature to enforce them");
    }

    timespec interval{PURGE_INTERVAL_SECONDS, 0};
    while(true)
    {
        int sig = sigtimedwait(&signals, nullptr, &interval);
        if(sig == SIGHUP)
        {
            spdlog::info("Reloading trusted agents...");
            reloadTrustedAgents(app, config_file);
        }
        else if(sig == SIGINT || sig == SIGTERM)
        {
            spdlog::info("Shutting down...");
            break;
        }
        else
        {
            app.paymentSessions().purgeExpired();
        }
    }
    app.stop();
    app.wait();
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    cxxopts::Options cmd_options("agentpay",
                                 "Merchant server for signed agent checkouts");
    cmd_options.add_options()
        ("c,config", "Config file",
         cxxopts::value<std::string>()->default_value(""))
        ("log-level", "trace, debug, info, warn or error",
         cxxopts::value<std::string>()->default_value("info"))
        ("alg", "rsa-pss-sha256 or ed25519",
         cxxopts::value<std::string>()->default_value("rsa-pss-sha256"))
        ("key", "Private key file in PEM (sign)",
         cxxopts::value<std::string>())
        ("agent", "Signature-Agent value (sign)",
         cxxopts::value<std::string>())
        ("key-id", "keyId parameter (sign)",
         cxxopts::value<std::string>()->default_value("primary"))
        ("authority", "@authority of the request (sign)",
         cxxopts::value<std::string>())
        ("path", "@path of the request (sign)",
         cxxopts::value<std::string>())
        ("tag", "tag parameter (sign)",
         cxxopts::value<std::string>()->default_value(TAG_BROWSER_AUTH))
        ("nonce", "nonce parameter (sign), random by default",
         cxxopts::value<std::string>())
        ("window", "Seconds the signature stays valid (sign)",
         cxxopts::value<int>()->default_value("480"))
        ("command", "serve, keygen or sign. serve does not check agent "
         "signatures on x402 checkout unless require_agent_signature is "
         "set in the config",
         cxxopts::value<std::string>()->default_value("serve"))
        ("h,help", "Print this message.");
    cmd_options.parse_positional({"command"});
    cmd_options.positional_help("[serve|keygen|sign]");

    cxxopts::ParseResult opts;
    try
    {
        opts = cmd_options.parse(argc, argv);
    }
    catch(const cxxopts::exceptions::exception& e)
    {
        std::cerr << e.what() << "\n" << cmd_options.help() << std::endl;
        return 1;
    }

    if(opts.count("help"))
    {
        std::cout << cmd_options.help() << std::endl;
        return 0;
    }

    spdlog::set_level(
        spdlog::level::from_str(opts["log-level"].as<std::string>()));

    const std::string command = opts["command"].as<std::string>();
    const std::string config_file = opts["config"].as<std::string>();
    try
    {
        if(command == "keygen")
        {
            return runKeygen(opts);
        }
        if(command == "sign")
        {
            return runSign(opts);
        }
        if(command != "serve")
        {
            std::cerr << "Unknown command: " << command << "\n"
                      << cmd_options.help() << std::endl;
            return 1;
        }

        if(!config_file.empty())
        {
            Config::get().load(config_file);
        }
        else
        {
            spdlog::warn("No config file given, using defaults");
        }
        return runServe(config_file);
    }
    catch(const std::runtime_error& e)
    {
        spdlog::error("{}", e.what());
        return 1;
    }
}
