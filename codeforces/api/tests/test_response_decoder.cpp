#include <catch2/catch.hpp>

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../include/response_decoder.hpp"

using namespace codeforces::api;
using nlohmann::json;

// ---------- Fixtures ---------------------------------------------------------

static json blogEntryJson() {
    return json::parse(R"({
        "originalLocale": "en",
        "allowViewHistory": true,
        "creationTimeSeconds": 1599036224,
        "rating": 1354,
        "authorHandle": "MikeMirzayanov",
        "modificationTimeSeconds": 1599043418,
        "id": 82347,
        "title": "<p>Codeforces: Results of 2020 [Annual Report]</p>",
        "locale": "en",
        "content": "<div class=\"ttypography\"><p>Hello</p></div>",
        "tags": ["2020", "codeforces", "results"]
    })");
}

static json partyJson(const std::string& handle) {
    return json{
        {"contestId", 1477},
        {"members", json::array({ json{{"handle", handle}} })},
        {"participantType", "CONTESTANT"},
        {"ghost", false},
        {"room", 12},
        {"startTimeSeconds", 1611586800}
    };
}

static json problemJson() {
    return json{
        {"contestId", 1477},
        {"index", "B"},
        {"name", "Nezzar and Binary String"},
        {"type", "PROGRAMMING"},
        {"points", 1000.0},
        {"rating", 1900},
        {"tags", json::array({"data structures", "greedy"})}
    };
}

static std::string ok(const json& result) {
    return json{{"status", "OK"}, {"result", result}}.dump();
}

// ---------- Envelope ---------------------------------------------------------

TEST_CASE("FAILED envelope becomes an api error carrying the comment") {
    auto r = ResponseDecoder::decode(R"({"status":"FAILED","comment":"blogEntryId: Blog entry with id -1 not found"})",
        ResultTag::comment_list);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error->kind == ErrorKind::api);
    CHECK(r.error->message == "blogEntryId: Blog entry with id -1 not found");
}

TEST_CASE("FAILED envelope is an api error even with a result present") {
    auto r = ResponseDecoder::decode(R"({"status":"FAILED","comment":"X","result":[]})", ResultTag::handle_list);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error->kind == ErrorKind::api);
    CHECK(r.error->message == "X");
}

TEST_CASE("OK envelope without result is a decode error naming result") {
    auto r = ResponseDecoder::decode(R"({"status":"OK"})", ResultTag::handle_list);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error->kind == ErrorKind::decode);
    CHECK(r.error->field == "result");
}

TEST_CASE("malformed bodies are decode errors") {
    SECTION("not JSON") {
        auto r = ResponseDecoder::decode("<html>502 Bad Gateway</html>", ResultTag::blog_entry);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error->kind == ErrorKind::decode);
        CHECK(r.error->field == "$");
    }
    SECTION("not an object") {
        auto r = ResponseDecoder::decode("[1,2,3]", ResultTag::blog_entry);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error->kind == ErrorKind::decode);
    }
    SECTION("missing status") {
        auto r = ResponseDecoder::decode(R"({"result":[]})", ResultTag::handle_list);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error->field == "status");
    }
    SECTION("unknown status") {
        auto r = ResponseDecoder::decode(R"({"status":"MAYBE","result":[]})", ResultTag::handle_list);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error->kind == ErrorKind::decode);
        CHECK(r.error->field == "status");
    }
}

TEST_CASE("decodeEnvelope exposes status, comment and raw result") {
    auto env = ResponseDecoder::decodeEnvelope(R"({"status":"OK","result":["a","b"]})");
    REQUIRE(env.has_value());
    CHECK(env.get().status == ResponseStatus::ok);
    CHECK_FALSE(env.get().comment.has_value());
    REQUIRE(env.get().result.has_value());
    CHECK(env.get().result->size() == 2);

    auto failed = ResponseDecoder::decodeEnvelope(R"({"status":"FAILED","comment":"apiKey: Incorrect API key"})");
    REQUIRE(failed.has_value());
    CHECK(failed.get().status == ResponseStatus::failed);
    CHECK(failed.get().comment.value() == "apiKey: Incorrect API key");
}

// ---------- Payloads ---------------------------------------------------------

TEST_CASE("blogEntry.view payload decodes to a blog entry with the requested id") {
    auto r = ResponseDecoder::decode(ok(blogEntryJson()), ResultTag::blog_entry);
    REQUIRE(r.has_value());
    REQUIRE(r.get().tag() == ResultTag::blog_entry);

    const auto* entry = r.get().get<BlogEntry>();
    REQUIRE(entry != nullptr);
    CHECK(entry->id == 82347);
    CHECK(entry->authorHandle == "MikeMirzayanov");
    CHECK(entry->allowViewHistory);
    CHECK(entry->rating == 1354);
    REQUIRE(entry->content.has_value());
    CHECK(entry->tags == std::vector<std::string>{"2020", "codeforces", "results"});

    CHECK(r.get().get<std::vector<BlogEntry>>() == nullptr);
}

TEST_CASE("missing required field is reported with its path") {
    auto j = blogEntryJson();
    j.erase("id");
    auto r = ResponseDecoder::decode(ok(j), ResultTag::blog_entry);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error->kind == ErrorKind::decode);
    CHECK(r.error->field == "result.id");
    CHECK(r.error->message.find("id") != std::string::npos);
}

TEST_CASE("wrong primitive type is reported with its path") {
    auto j = blogEntryJson();
    j["rating"] = "high";
    auto r = ResponseDecoder::decode(ok(j), ResultTag::blog_entry);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error->kind == ErrorKind::decode);
    CHECK(r.error->field == "result.rating");
}

TEST_CASE("integers beyond the signed 64-bit range are decode errors") {
    const std::string change = R"({"contestId":1477,"contestName":"Round","handle":"thud","rank":18446744073709551615,)"
                               R"("ratingUpdateTimeSeconds":1611600000,"oldRating":2100,"newRating":2150})";
    auto r = ResponseDecoder::decode(R"({"status":"OK","result":[)" + change + "]}", ResultTag::rating_change_list);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error->kind == ErrorKind::decode);
    CHECK(r.error->field == "result[0].rank");

    const std::string atLimit = R"({"contestId":1477,"contestName":"Round","handle":"thud","rank":9223372036854775807,)"
                                R"("ratingUpdateTimeSeconds":1611600000,"oldRating":2100,"newRating":2150})";
    auto inRange = ResponseDecoder::decode(R"({"status":"OK","result":[)" + atLimit + "]}", ResultTag::rating_change_list);
    REQUIRE(inRange.has_value());
    CHECK(inRange.get().get<std::vector<RatingChange>>()->at(0).rank == 9223372036854775807LL);
}

TEST_CASE("optional fields may be absent or null") {
    auto j = blogEntryJson();
    j.erase("content");
    auto absent = ResponseDecoder::decode(ok(j), ResultTag::blog_entry);
    REQUIRE(absent.has_value());
    CHECK_FALSE(absent.get().get<BlogEntry>()->content.has_value());

    j["content"] = nullptr;
    auto null = ResponseDecoder::decode(ok(j), ResultTag::blog_entry);
    REQUIRE(null.has_value());
    CHECK_FALSE(null.get().get<BlogEntry>()->content.has_value());
}

TEST_CASE("unknown members are ignored") {
    auto j = blogEntryJson();
    j["somethingNew"] = json{{"nested", true}};
    CHECK(ResponseDecoder::decode(ok(j), ResultTag::blog_entry).has_value());
}

TEST_CASE("payload shape must match the expected tag") {
    auto r = ResponseDecoder::decode(ok(blogEntryJson()), ResultTag::blog_entry_list);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error->kind == ErrorKind::decode);
    CHECK(r.error->field == "result");
}

TEST_CASE("user.friends decodes to a handle list") {
    auto r = ResponseDecoder::decode(R"({"status":"OK","result":["tourist","Petr"]})", ResultTag::handle_list);
    REQUIRE(r.has_value());
    CHECK(r.get().tag() == ResultTag::handle_list);
    CHECK(*r.get().get<std::vector<std::string>>() == std::vector<std::string>{"tourist", "Petr"});
}

TEST_CASE("empty result lists are valid") {
    auto r = ResponseDecoder::decode(R"({"status":"OK","result":[]})", ResultTag::hack_list);
    REQUIRE(r.has_value());
    CHECK(r.get().tag() == ResultTag::hack_list);
    CHECK(r.get().get<std::vector<Hack>>()->empty());
}

TEST_CASE("contest.list decodes contest enums") {
    json contests = json::array({
        json{{"id", 1477}, {"name", "Codeforces Round #698 (Div. 1)"}, {"type", "CF"},
             {"phase", "FINISHED"}, {"frozen", false}, {"durationSeconds", 7200},
             {"startTimeSeconds", 1611586800}, {"relativeTimeSeconds", 123456}},
        json{{"id", 1500}, {"name", "Upcoming"}, {"type", "ICPC"},
             {"phase", "BEFORE"}, {"durationSeconds", 18000}}
    });

    auto r = ResponseDecoder::decode(ok(contests), ResultTag::contest_list);
    REQUIRE(r.has_value());
    const auto& v = *r.get().get<std::vector<Contest>>();
    REQUIRE(v.size() == 2);
    CHECK(v[0].type == ContestType::codeforces);
    CHECK(v[0].phase == ContestPhase::finished);
    CHECK(v[0].startTimeSeconds.value() == 1611586800);
    CHECK(v[1].type == ContestType::icpc);
    CHECK(v[1].phase == ContestPhase::before);
    CHECK_FALSE(v[1].startTimeSeconds.has_value());
}

TEST_CASE("unknown enum value is a decode error at that field") {
    json contests = json::array({
        json{{"id", 1}, {"name", "x"}, {"type", "CF"}, {"phase", "ABANDONED"}, {"durationSeconds", 1}}
    });
    auto r = ResponseDecoder::decode(ok(contests), ResultTag::contest_list);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error->field == "result[0].phase");
}

TEST_CASE("user.status decodes submissions with nested problem and author") {
    json sub{
        {"id", 105000000},
        {"contestId", 1477},
        {"creationTimeSeconds", 1611590000},
        {"relativeTimeSeconds", 3200},
        {"problem", problemJson()},
        {"author", partyJson("thud")},
        {"programmingLanguage", "GNU C++17"},
        {"verdict", "OK"},
        {"testset", "TESTS"},
        {"passedTestCount", 42},
        {"timeConsumedMillis", 187},
        {"memoryConsumedBytes", 4096000}
    };
    json queued = sub;
    queued.erase("verdict");
    queued["testset"] = "PRETESTS";

    auto r = ResponseDecoder::decode(ok(json::array({sub, queued})), ResultTag::submission_list);
    REQUIRE(r.has_value());
    const auto& v = *r.get().get<std::vector<Submission>>();
    REQUIRE(v.size() == 2);

    CHECK(v[0].verdict.value() == Verdict::ok);
    CHECK(v[0].testset == Testset::tests);
    CHECK(v[0].problem.index.value() == "B");
    CHECK(v[0].problem.points.value() == Catch::Detail::Approx(1000.0));
    CHECK(v[0].author.members.at(0).handle == "thud");
    CHECK(v[0].author.participantType == ParticipantType::contestant);

    CHECK_FALSE(v[1].verdict.has_value());
    CHECK(v[1].testset == Testset::pretests);
}

TEST_CASE("nested decode errors carry the full path") {
    json sub{
        {"id", 1}, {"creationTimeSeconds", 1}, {"problem", problemJson()},
        {"author", partyJson("thud")}, {"programmingLanguage", "x"},
        {"testset", "TESTS"}, {"passedTestCount", 0}, {"timeConsumedMillis", 0},
        {"memoryConsumedBytes", 0}
    };
    json broken = sub;
    broken["author"]["members"][0].erase("handle");

    auto r = ResponseDecoder::decode(ok(json::array({sub, broken})), ResultTag::submission_list);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error->kind == ErrorKind::decode);
    CHECK(r.error->field == "result[1].author.members[0].handle");
}

TEST_CASE("contest.standings decodes contest, problems and rows") {
    json standings{
        {"contest", json{{"id", 1477}, {"name", "Round"}, {"type", "CF"}, {"phase", "FINISHED"}, {"durationSeconds", 7200}}},
        {"problems", json::array({problemJson()})},
        {"rows", json::array({ json{
            {"party", partyJson("thud")},
            {"rank", 57},
            {"points", 2345.0},
            {"penalty", 0},
            {"successfulHackCount", 1},
            {"unsuccessfulHackCount", 0},
            {"problemResults", json::array({
                json{{"points", 1000.0}, {"rejectedAttemptCount", 1}, {"type", "FINAL"}, {"bestSubmissionTimeSeconds", 600}},
                json{{"points", 0.0}, {"rejectedAttemptCount", 0}, {"type", "PRELIMINARY"}}
            })}
        }})}
    };

    auto r = ResponseDecoder::decode(ok(standings), ResultTag::contest_standings);
    REQUIRE(r.has_value());
    const auto* s = r.get().get<ContestStandings>();
    REQUIRE(s != nullptr);
    CHECK(s->contest.id == 1477);
    REQUIRE(s->problems.size() == 1);
    REQUIRE(s->rows.size() == 1);
    CHECK(s->rows[0].rank == 57);
    CHECK(s->rows[0].points == Catch::Detail::Approx(2345.0));
    REQUIRE(s->rows[0].problemResults.size() == 2);
    CHECK(s->rows[0].problemResults[0].type == ProblemResultType::final_);
    CHECK(s->rows[0].problemResults[1].type == ProblemResultType::preliminary);
    CHECK_FALSE(s->rows[0].lastSubmissionTimeSeconds.has_value());
}

TEST_CASE("contest.hacks decodes parties, verdict and judge protocol") {
    json hack{
        {"id", 700000},
        {"creationTimeSeconds", 1611588000},
        {"hacker", partyJson("hacker")},
        {"defender", partyJson("defender")},
        {"verdict", "HACK_SUCCESSFUL"},
        {"problem", problemJson()},
        {"test", "1\n5\n"},
        {"judgeProtocol", json{{"manual", "false"}, {"protocol", "Solution verdict: WRONG_ANSWER"}, {"verdict", "Successful hacking attempt"}}}
    };

    auto r = ResponseDecoder::decode(ok(json::array({hack})), ResultTag::hack_list);
    REQUIRE(r.has_value());
    const auto& v = *r.get().get<std::vector<Hack>>();
    REQUIRE(v.size() == 1);
    CHECK(v[0].verdict.value() == HackVerdict::hack_successful);
    CHECK(v[0].hacker.members.at(0).handle == "hacker");
    CHECK(v[0].defender.members.at(0).handle == "defender");
    REQUIRE(v[0].judgeProtocol.has_value());
    CHECK(v[0].judgeProtocol->manual == "false");
}

TEST_CASE("problemset.problems decodes problems and statistics") {
    json ps{
        {"problems", json::array({problemJson()})},
        {"problemStatistics", json::array({ json{{"contestId", 1477}, {"index", "B"}, {"solvedCount", 5000}} })}
    };
    auto r = ResponseDecoder::decode(ok(ps), ResultTag::problemset);
    REQUIRE(r.has_value());
    const auto* p = r.get().get<Problemset>();
    REQUIRE(p != nullptr);
    CHECK(p->problems.at(0).type == ProblemType::programming);
    CHECK(p->problemStatistics.at(0).solvedCount == 5000);
}

TEST_CASE("recentActions decodes optional blog entry and comment") {
    json comment{
        {"id", 1}, {"creationTimeSeconds", 2}, {"commentatorHandle", "Petr"},
        {"locale", "en"}, {"text", "nice"}, {"parentCommentId", 7}, {"rating", 3}
    };
    json actions = json::array({
        json{{"timeSeconds", 100}, {"blogEntry", blogEntryJson()}, {"comment", comment}},
        json{{"timeSeconds", 101}, {"blogEntry", blogEntryJson()}}
    });

    auto r = ResponseDecoder::decode(ok(actions), ResultTag::recent_action_list);
    REQUIRE(r.has_value());
    const auto& v = *r.get().get<std::vector<RecentAction>>();
    REQUIRE(v.size() == 2);
    REQUIRE(v[0].comment.has_value());
    CHECK(v[0].comment->parentCommentId.value() == 7);
    CHECK(v[0].blogEntry->id == 82347);
    CHECK_FALSE(v[1].comment.has_value());
}

TEST_CASE("user.rating and user.info decode rating changes and users") {
    json change{
        {"contestId", 1477}, {"contestName", "Round"}, {"handle", "thud"}, {"rank", 57},
        {"ratingUpdateTimeSeconds", 1611600000}, {"oldRating", 2100}, {"newRating", 2150}
    };
    auto rc = ResponseDecoder::decode(ok(json::array({change})), ResultTag::rating_change_list);
    REQUIRE(rc.has_value());
    CHECK(rc.get().get<std::vector<RatingChange>>()->at(0).newRating == 2150);

    json user{
        {"handle", "tourist"}, {"country", "Belarus"}, {"contribution", 120},
        {"rank", "legendary grandmaster"}, {"rating", 3800}, {"maxRank", "tourist"},
        {"maxRating", 4000}, {"lastOnlineTimeSeconds", 1700000000},
        {"registrationTimeSeconds", 1265987288}, {"friendOfCount", 60000},
        {"avatar", "https://userpic.codeforces.org/a.jpg"},
        {"titlePhoto", "https://userpic.codeforces.org/t.jpg"}
    };
    auto ui = ResponseDecoder::decode(ok(json::array({user})), ResultTag::user_list);
    REQUIRE(ui.has_value());
    const auto& u = ui.get().get<std::vector<User>>()->at(0);
    CHECK(u.handle == "tourist");
    CHECK(u.rating.value() == 3800);
    CHECK_FALSE(u.email.has_value());
    CHECK(u.country.value() == "Belarus");
}

TEST_CASE("comments and blog entry lists") {
    json comment{
        {"id", 1}, {"creationTimeSeconds", 2}, {"commentatorHandle", "Petr"},
        {"locale", "en"}, {"text", "nice"}, {"rating", 3}
    };
    auto c = ResponseDecoder::decode(ok(json::array({comment})), ResultTag::comment_list);
    REQUIRE(c.has_value());
    CHECK(c.get().tag() == ResultTag::comment_list);
    CHECK_FALSE(c.get().get<std::vector<Comment>>()->at(0).parentCommentId.has_value());

    auto b = ResponseDecoder::decode(ok(json::array({blogEntryJson(), blogEntryJson()})), ResultTag::blog_entry_list);
    REQUIRE(b.has_value());
    CHECK(b.get().tag() == ResultTag::blog_entry_list);
    CHECK(b.get().get<std::vector<BlogEntry>>()->size() == 2);
}

// ---------- Result model ----------------------------------------------------

TEST_CASE("ApiResult::make selects the alternative named by the tag") {
    auto r = ApiResult::make<ResultTag::blog_entry_list>(std::vector<BlogEntry>{});
    CHECK(r.tag() == ResultTag::blog_entry_list);
    CHECK(r.get<std::vector<BlogEntry>>() != nullptr);
    CHECK(r.get<BlogEntry>() == nullptr);
    CHECK(toString(r.tag()) == "blog_entry_list");
}

TEST_CASE("enum wire names round through parse and toString") {
    CHECK(parseContestType("CF") == ContestType::codeforces);
    CHECK(toString(ContestType::codeforces) == "CF");
    CHECK(parseTestset("TESTS10") == Testset::tests10);
    CHECK(toString(Testset::tests3) == "TESTS3");
    CHECK(parseVerdict("IDLENESS_LIMIT_EXCEEDED") == Verdict::idleness_limit_exceeded);
    CHECK(parseParticipantType("OUT_OF_COMPETITION") == ParticipantType::out_of_competition);
    CHECK_FALSE(parseVerdict("ok").has_value());
}
