#include "../codeforces/api/include/api_client.hpp"
#include "../codeforces/api/include/commands.hpp"
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace codeforces::api;


static void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <command> [arg]\n"
              << "  blog <blogEntryId>   blogEntry.view\n"
              << "  contests             contest.list (regular contests)\n"
              << "  user <handle>        user.info\n"
              << "  rating <handle>      user.rating\n"
              << "  raw <blogEntryId>    blogEntry.view, body printed as received\n"
              << "Credentials are read from CODEFORCES_API_KEY and CODEFORCES_API_SECRET.\n";
}


static bool parseId(const std::string& s, std::int64_t& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}


static int report(const Error& err) {
    std::cerr << describe(err) << std::endl;
    return 2;
}


int main(int argc, char* argv[])
{
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    const char* key = std::getenv("CODEFORCES_API_KEY");
    const char* secret = std::getenv("CODEFORCES_API_SECRET");
    if (!key || !secret) {
        std::cerr << "CODEFORCES_API_KEY and CODEFORCES_API_SECRET must be set" << std::endl;
        return 1;
    }
    Credentials creds{key, secret};

    // stdout carries the results; logs go to stderr
    auto log = std::make_shared<codeforces::logger::Logger>(std::make_shared<codeforces::logger::StderrSink>());
    log->setLevel(codeforces::logger::LogLevel::debug);
    ApiClient client(makeCurlClient(), ApiClientConfig{}, std::make_shared<RandomNonceSource>(),
        std::make_shared<SystemClock>(), log);

    const std::string command = argv[1];
    const std::string arg = argc > 2 ? argv[2] : "";

    if (command == "blog" || command == "raw") {
        std::int64_t id = 0;
        if (!parseId(arg, id)) { printUsage(argv[0]); return 1; }
        commands::BlogEntryView cmd(id);

        if (command == "raw") {
            auto body = client.executeRaw(cmd, creds);
            if (!body.has_value()) return report(*body.error);
            std::cout << body.get() << std::endl;
            return 0;
        }

        auto r = client.execute(cmd, creds);
        if (!r.has_value()) return report(*r.error);
        if (const auto* entry = r.get().get<BlogEntry>()) {
            std::cout << entry->id << " by " << entry->authorHandle << ": " << entry->title
                      << " (rating " << entry->rating << ")" << std::endl;
        }
    }
    else if (command == "contests") {
        commands::ContestList cmd;
        cmd.gym = false;
        auto r = client.execute(cmd, creds);
        if (!r.has_value()) return report(*r.error);
        if (const auto* contests = r.get().get<std::vector<Contest>>()) {
            for (const auto& c : *contests) {
                std::cout << c.id << "\t" << toString(c.phase) << "\t" << c.name << "\n";
            }
        }
    }
    else if (command == "user") {
        if (arg.empty()) { printUsage(argv[0]); return 1; }
        commands::UserInfo cmd(std::vector<std::string>{arg});
        auto r = client.execute(cmd, creds);
        if (!r.has_value()) return report(*r.error);
        if (const auto* users = r.get().get<std::vector<User>>()) {
            for (const auto& u : *users) {
                std::cout << u.handle << "\trating=" << u.rating.value_or(0)
                          << "\trank=" << u.rank.value_or("unrated") << "\n";
            }
        }
    }
    else if (command == "rating") {
        if (arg.empty()) { printUsage(argv[0]); return 1; }
        commands::UserRating cmd(arg);
        auto r = client.execute(cmd, creds);
        if (!r.has_value()) return report(*r.error);
        if (const auto* changes = r.get().get<std::vector<RatingChange>>()) {
            for (const auto& c : *changes) {
                std::cout << c.contestId << "\t" << c.oldRating << " -> " << c.newRating
                          << "\t" << c.contestName << "\n";
            }
        }
    }
    else {
        printUsage(argv[0]);
        return 1;
    }

    return 0;
}
