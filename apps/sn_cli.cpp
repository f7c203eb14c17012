#include "sanctions/pipeline/screening_pipeline.hpp"
#include "sanctions/core/config.hpp"
#include "sanctions/core/errors.hpp"
#include "sanctions/core/types.hpp"
#include "sanctions/matching/ngram_similarity_provider.hpp"
#include "sanctions/storage/in_memory_result_store.hpp"
#include "sanctions/watchlist/in_memory_watchlist_store.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace sn;

namespace {

bool parseSize(const std::string& value, std::size_t& out) {
    char* end = nullptr;
    const long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (end == value.c_str() || *end != '\0' || parsed <= 0) {
        return false;
    }
    out = static_cast<std::size_t>(parsed);
    return true;
}

bool parseArguments(int argc, char** argv, core::PipelineConfig& config, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--workers" || arg == "--queue-size" || arg == "--timeout-ms") {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            std::size_t value = 0;
            if (!parseSize(argv[i + 1], value)) {
                error = "Invalid value for " + arg + ": " + argv[i + 1];
                return false;
            }
            if (arg == "--workers") {
                config.prefetch = value;
            } else if (arg == "--queue-size") {
                config.queueSize = value;
            } else {
                config.screeningTimeout = std::chrono::milliseconds(static_cast<long long>(value));
            }
            ++i;
        } else if (arg == "--help" || arg == "-h") {
            error = "";
            return false;
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }
    }
    return true;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--workers N] [--queue-size N] [--timeout-ms N]\n"
              << "Commands:\n"
              << "  screen <name>[|alias...]\n"
              << "  pay <sender> | <recipient> [amount currency]\n"
              << "  stats\n"
              << "  lists\n"
              << "  q\n";
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> splitOn(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string part;
    while (std::getline(ss, part, sep)) {
        parts.push_back(trim(part));
    }
    return parts;
}

core::WatchlistRecord makeRecord(
    std::string listName, std::string source, std::string country,
    std::string name, std::vector<std::string> aliases,
    std::optional<std::string> dob, std::optional<std::string> nationality,
    std::optional<std::string> passport, core::EntityType type,
    std::string designated, std::string reason
) {
    core::WatchlistRecord r;
    r.listName = std::move(listName);
    r.source = std::move(source);
    r.country = std::move(country);
    r.name = std::move(name);
    r.aliases = std::move(aliases);
    r.dateOfBirth = std::move(dob);
    r.nationality = std::move(nationality);
    r.documentNumber = std::move(passport);
    r.type = type;
    r.designationDate = std::move(designated);
    r.reason = std::move(reason);
    return r;
}

void loadSampleWatchlist(watchlist::InMemoryWatchlistStore& store) {
    using core::EntityType;
    store.upsert(makeRecord("OFAC SDN List", "OFAC", "United States", "Osama bin Laden",
        {"Usama bin Laden", "Osama bin Ladin"}, "1957-03-10", "Saudi Arabian", std::nullopt,
        EntityType::Individual, "1999-01-20", "Terrorism - Leader of al-Qaeda"));
    store.upsert(makeRecord("OFAC SDN List", "OFAC", "United States", "Ayman al-Zawahiri",
        {"Ayman al-Zawahri", "Dr. Ayman al-Zawahiri"}, "1951-06-19", "Egyptian", std::nullopt,
        EntityType::Individual, "2001-09-23", "Terrorism - al-Qaeda leadership"));
    store.upsert(makeRecord("UN Security Council", "UN", "International", "Kim Jong-un",
        {"Kim Jong Un", "Kim Jong Eun"}, "1984-01-08", "North Korean", std::nullopt,
        EntityType::Individual, "2017-12-22", "Nuclear proliferation - DPRK leadership"));
    store.upsert(makeRecord("EU Sanctions", "EU", "European Union", "Vladimir Putin",
        {"Vladimir Vladimirovich Putin"}, "1952-10-07", "Russian", std::nullopt,
        EntityType::Individual, "2022-02-25", "Aggression against Ukraine"));
    store.upsert(makeRecord("OFAC SDN List", "OFAC", "United States", "Hezbollah",
        {"Hizballah", "Party of God"}, std::nullopt, std::nullopt, std::nullopt,
        EntityType::Organization, "1997-10-31", "Terrorism - Foreign terrorist organization"));
    store.upsert(makeRecord("OFAC SDN List", "OFAC", "United States", "Hamas",
        {"Islamic Resistance Movement"}, std::nullopt, std::nullopt, std::nullopt,
        EntityType::Organization, "1997-10-31", "Terrorism - Foreign terrorist organization"));
    store.upsert(makeRecord("UN Security Council", "UN", "International", "Taliban",
        {"Islamic Emirate of Afghanistan"}, std::nullopt, std::nullopt, std::nullopt,
        EntityType::Organization, "1999-10-15", "Terrorism - Taliban regime"));
    store.upsert(makeRecord("OFAC SDN List", "OFAC", "United States", "John Smith",
        {"Johnny Smith", "J. Smith"}, "1980-05-15", "American", "A12345678",
        EntityType::Individual, "2023-01-15", "Money laundering - Financial crimes"));
    store.upsert(makeRecord("EU Sanctions", "EU", "European Union", "Maria Garcia",
        {"Maria G. Rodriguez"}, "1975-12-03", "Spanish", "ESP78901234",
        EntityType::Individual, "2022-06-10", "Corruption - Public office abuse"));
    store.upsert(makeRecord("UK Sanctions", "UK", "United Kingdom", "Robert Johnson",
        {"Bob Johnson", "R. Johnson"}, "1965-08-22", "British", "GBP45678901",
        EntityType::Individual, "2023-03-20", "Human rights violations"));
}

void printScreening(const core::ScreeningResult& result, const char* indent = "") {
    std::cout << indent << "RESULT: decision=" << core::toString(result.decision)
              << " risk=" << result.riskScore
              << " confidence=" << result.confidence
              << " findings=" << result.findings.size()
              << " latency_us=" << result.latency.count() << "\n";
    for (const auto& f : result.findings) {
        std::cout << indent << "  MATCH: " << f.record.name
                  << " [" << f.record.listName << "]"
                  << " strategy=" << core::toString(f.strategy)
                  << " confidence=" << f.confidence;
        const auto fields = f.matchedFields.names();
        if (!fields.empty()) {
            std::cout << " fields=";
            for (std::size_t i = 0; i < fields.size(); ++i) {
                std::cout << (i ? "," : "") << fields[i];
            }
        }
        std::cout << "\n";
    }
}

void printPublished(const events::PublishedResult& published) {
    const auto& r = published.result;
    std::cout << "PAYMENT: id=" << r.paymentId
              << " key=" << published.routingKey
              << " status=" << events::toString(r.status)
              << " risk=" << r.riskScore
              << " time_us=" << r.processingTime.count();
    if (r.metadata.error) {
        std::cout << " error=\"" << *r.metadata.error << "\"";
    }
    std::cout << "\n";
    if (r.sender) {
        std::cout << "  sender:\n";
        printScreening(*r.sender, "    ");
    }
    if (r.recipient) {
        std::cout << "  recipient:\n";
        printScreening(*r.recipient, "    ");
    }
}

// "<recipient words...> [amount currency]"
void parseRecipient(const std::string& text, events::PaymentEvent& event) {
    std::istringstream in(text);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) words.push_back(word);

    if (words.size() >= 3) {
        char* end = nullptr;
        const std::string& amount = words[words.size() - 2];
        const double parsed = std::strtod(amount.c_str(), &end);
        if (end != amount.c_str() && *end == '\0') {
            event.amount = parsed;
            event.currency = words.back();
            words.resize(words.size() - 2);
        }
    }
    std::string name;
    for (const auto& w : words) {
        if (!name.empty()) name += ' ';
        name += w;
    }
    event.recipientName = name;
}

} // namespace

int main(int argc, char** argv) {
    core::ScreeningThresholds thresholds;
    core::PipelineConfig config;
    try {
        thresholds = core::loadThresholdsFromEnv();
        config = core::loadPipelineConfigFromEnv();
    } catch (const core::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    std::string error;
    if (!parseArguments(argc, argv, config, error)) {
        if (!error.empty()) {
            std::cerr << error << "\n";
        }
        printUsage(argv[0]);
        return error.empty() ? 0 : 1;
    }

    auto store = std::make_shared<watchlist::InMemoryWatchlistStore>();
    loadSampleWatchlist(*store);
    auto similarity = std::make_shared<matching::NgramSimilarityProvider>();
    auto results = std::make_shared<storage::InMemoryResultStore>();

    std::unique_ptr<pipeline::ScreeningPipeline> service;
    try {
        service = std::make_unique<pipeline::ScreeningPipeline>(
            store, similarity, thresholds, config, results);
        service->start();
    } catch (const std::exception& e) {
        std::cerr << "Startup failed: " << e.what() << "\n";
        return 1;
    }

    service->setResultCallback(printPublished);

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Sanctions screening CLI (q to quit)\n";
    std::string cmd;
    std::uint64_t nextPayment = 1;

    while (std::cin >> cmd) {
        if (cmd == "q") {
            break;
        }

        // Print any results completed since the last command
        service->processResults();

        std::string rest;
        std::getline(std::cin, rest);
        rest = trim(rest);

        if (cmd == "screen") {
            auto names = splitOn(rest, '|');
            if (names.empty() || names.front().empty()) {
                std::cout << "usage: screen <name>[|alias...]\n";
                continue;
            }
            core::Candidate candidate;
            candidate.name = names.front();
            candidate.aliases.assign(names.begin() + 1, names.end());
            try {
                printScreening(service->screen(candidate));
            } catch (const core::InvalidCandidateError& e) {
                std::cout << "INVALID: " << e.what() << "\n";
            }
        } else if (cmd == "pay") {
            auto parts = splitOn(rest, '|');
            if (parts.size() != 2) {
                std::cout << "usage: pay <sender> | <recipient> [amount currency]\n";
                continue;
            }
            events::PaymentEvent event;
            event.paymentId = "PAY-" + std::to_string(nextPayment);
            event.transactionId = "TXN-" + std::to_string(nextPayment);
            ++nextPayment;
            event.senderName = parts[0];
            parseRecipient(parts[1], event);
            event.ts = std::chrono::system_clock::now();

            const std::string id = event.paymentId;
            const bool submitted = service->submitPayment(std::move(event));
            if (submitted) {
                std::cout << "SUBMITTED " << id << "\n";
            } else {
                std::cout << (service->isQueueFull() ? "QUEUE_FULL" : "REJECTED") << "\n";
            }
        } else if (cmd == "stats") {
            const auto s = service->statistics();
            std::cout << "STATS: total=" << s.totalProcessed
                      << " processed=" << service->processedCount()
                      << " cleared=" << s.cleared
                      << " review=" << s.review
                      << " blocked=" << s.blocked
                      << " errors=" << s.errors
                      << " avg_latency_ms=" << s.averageLatencyMs
                      << " samples=" << s.latencySamples << "\n";
        } else if (cmd == "lists") {
            for (const auto& list : store->listNames()) {
                std::cout << list.listName << " (" << list.source << "): "
                          << list.activeRecords << " active\n";
            }
        } else {
            std::cout << "unknown\n";
        }
    }

    service->stop();
    service->processResults();
    return 0;
}
