#include <cstdint>
#include <limits>
#include <utility>
#include <vector>
#include "../include/response_decoder.hpp"


namespace codeforces::api {

    namespace {

        using nlohmann::json;

        struct DecodeFailure
        {
            std::string field;
            std::string message;
        };


        const char* typeName(const json& v) {
            return v.type_name();
        }

        [[noreturn]] void wrongType(const json& v, const std::string& path, const char* expected) {
            throw DecodeFailure{path, std::string("expected ") + expected + ", got " + typeName(v)};
        }

        std::int64_t asInt(const json& v, const std::string& path) {
            if (!v.is_number_integer()) wrongType(v, path, "integer");
            if (v.is_number_unsigned() && v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                throw DecodeFailure{path, "integer out of range"};
            }
            return v.get<std::int64_t>();
        }

        double asDouble(const json& v, const std::string& path) {
            if (!v.is_number()) wrongType(v, path, "number");
            return v.get<double>();
        }

        bool asBool(const json& v, const std::string& path) {
            if (!v.is_boolean()) wrongType(v, path, "boolean");
            return v.get<bool>();
        }

        std::string asString(const json& v, const std::string& path) {
            if (!v.is_string()) wrongType(v, path, "string");
            return v.get<std::string>();
        }

        template <typename F>
        auto asList(const json& v, const std::string& path, F decodeItem)
            -> std::vector<decltype(decodeItem(v, path))>
        {
            if (!v.is_array()) wrongType(v, path, "array");

            std::vector<decltype(decodeItem(v, path))> out;
            out.reserve(v.size());
            for (std::size_t i = 0; i < v.size(); ++i) {
                out.push_back(decodeItem(v[i], path + "[" + std::to_string(i) + "]"));
            }
            return out;
        }

        template <typename E>
        E asEnum(const json& v, const std::string& path, std::optional<E> (*parse)(std::string_view)) {
            auto s = asString(v, path);
            auto e = parse(s);
            if (!e) throw DecodeFailure{path, "unknown value '" + s + "'"};
            return *e;
        }


        // Member access on one JSON object, tracking the path for error reports.
        class ObjectReader
        {
        public:
            ObjectReader(const json& v, std::string path) : obj_(v), path_(std::move(path)) {
                if (!obj_.is_object()) wrongType(obj_, path_, "object");
            }

            std::int64_t integer(const char* key) const { return asInt(member(key), pathOf(key)); }
            double number(const char* key) const { return asDouble(member(key), pathOf(key)); }
            bool boolean(const char* key) const { return asBool(member(key), pathOf(key)); }
            std::string string(const char* key) const { return asString(member(key), pathOf(key)); }

            std::optional<std::int64_t> optInteger(const char* key) const {
                const json* v = optMember(key);
                if (!v) return std::nullopt;
                return asInt(*v, pathOf(key));
            }

            std::optional<double> optNumber(const char* key) const {
                const json* v = optMember(key);
                if (!v) return std::nullopt;
                return asDouble(*v, pathOf(key));
            }

            std::optional<std::string> optString(const char* key) const {
                const json* v = optMember(key);
                if (!v) return std::nullopt;
                return asString(*v, pathOf(key));
            }

            std::vector<std::string> strings(const char* key) const {
                return asList(member(key), pathOf(key), asString);
            }

            template <typename F>
            auto object(const char* key, F decode) const { return decode(member(key), pathOf(key)); }

            template <typename F>
            auto optObject(const char* key, F decode) const
                -> std::optional<decltype(decode(std::declval<const json&>(), std::declval<const std::string&>()))>
            {
                const json* v = optMember(key);
                if (!v) return std::nullopt;
                return decode(*v, pathOf(key));
            }

            template <typename F>
            auto list(const char* key, F decodeItem) const { return asList(member(key), pathOf(key), decodeItem); }

            template <typename E>
            E enumeration(const char* key, std::optional<E> (*parse)(std::string_view)) const {
                return asEnum(member(key), pathOf(key), parse);
            }

            template <typename E>
            std::optional<E> optEnumeration(const char* key, std::optional<E> (*parse)(std::string_view)) const {
                const json* v = optMember(key);
                if (!v) return std::nullopt;
                return asEnum(*v, pathOf(key), parse);
            }

        private:
            std::string pathOf(const char* key) const { return path_ + "." + key; }

            const json& member(const char* key) const {
                auto it = obj_.find(key);
                if (it == obj_.end()) throw DecodeFailure{pathOf(key), std::string("missing required field '") + key + "'"};
                return *it;
            }

            // absent and null are both "not set"
            const json* optMember(const char* key) const {
                auto it = obj_.find(key);
                if (it == obj_.end() || it->is_null()) return nullptr;
                return &*it;
            }

            const json& obj_;
            std::string path_;
        };


        // ---------- entity decoders ----------

        User decodeUser(const json& v, const std::string& path)
        {
            ObjectReader r(v, path);
            User u;
            u.handle = r.string("handle");
            u.email = r.optString("email");
            u.vkId = r.optString("vkId");
            u.openId = r.optString("openId");
            u.firstName = r.optString("firstName");
            u.lastName = r.optString("lastName");
            u.country = r.optString("country");
            u.city = r.optString("city");
            u.organization = r.optString("organization");
            u.contribution = r.integer("contribution");
            u.rank = r.optString("rank");
            u.rating = r.optInteger("rating");
            u.maxRank = r.optString("maxRank");
            u.maxRating = r.optInteger("maxRating");
            u.lastOnlineTimeSeconds = r.integer("lastOnlineTimeSeconds");
            u.registrationTimeSeconds = r.integer("registrationTimeSeconds");
            u.friendOfCount = r.integer("friendOfCount");
            u.avatar = r.string("avatar");
            u.titlePhoto = r.string("titlePhoto");
            return u;
        }

        BlogEntry decodeBlogEntry(const json& v, const std::string& path)
        {
            ObjectReader r(v, path);
            BlogEntry b;
            b.id = r.integer("id");
            b.originalLocale = r.string("originalLocale");
            b.creationTimeSeconds = r.integer("creationTimeSeconds");
            b.authorHandle = r.string("authorHandle");
            b.title = r.string("title");
            b.content = r.optString("content");
            b.locale = r.string("locale");
            b.modificationTimeSeconds = r.integer("modificationTimeSeconds");
            b.allowViewHistory = r.boolean("allowViewHistory");
            b.tags = r.strings("tags");
            b.rating = r.integer("rating");
            return b;
        }

        Comment decodeComment(const json& v, const std::string& path)
        {
            ObjectReader r(v, path);
            Comment c;
            c.id = r.integer("id");
            c.creationTimeSeconds = r.integer("creationTimeSeconds");
            c.commentatorHandle = r.string("commentatorHandle");
            c.locale = r.string("locale");
            c.text = r.string("text");
            c.parentCommentId = r.optInteger("parentCommentId");
            c.rating = r.integer("rating");
            return c;
        }

        RecentAction decodeRecentAction(const json& v, const std::string& path)
        {
            ObjectReader r(v, path);
            RecentAction a;
            a.timeSeconds = r.integer("timeSeconds");
            a.blogEntry = r.optObject("blogEntry", decodeBlogEntry);
            a.comment = r.optObject("comment", decodeComment);
            return a;
        }

        RatingChange decodeRatingChange(const json& v, const std::string& path)
        {
            ObjectReader r(v, path);
            RatingChange c;
            c.contestId = r.integer("contestId");
            c.contestName = r.string("contestName");
            c.handle = r.string("handle");
            c.rank = r.integer("rank");
            c.ratingUpdateTimeSeconds = r.integer("ratingUpdateTimeSeconds");
            c.oldRating = r.integer("oldRating");
            c.newRating = r.integer("newRating");
            return c;
        }

        Contest decodeContest(const json& v, const std::string& path)
        {
            ObjectReader r(v, path);
            Contest c;
            c.id = r.integer("id");
            c.name = r.string("name");
            c.type = r.enumeration("type", parseContestType);
            c.phase = r.enumeration("phase", parseContestPhase);
            c.durationSeconds = r.integer("durationSeconds");
            c.startTimeSeconds = r.optInteger("startTimeSeconds");
            c.relativeTimeSeconds = r.optInteger("relativeTimeSeconds");
            c.preparedBy = r.optString("preparedBy");
            c.websiteUrl = r.optString("websiteUrl");
            c.description = r.optString("description");
            c.difficulty = r.optInteger("difficulty");
            c.kind = r.optString("kind");
            c.icpcRegion = r.optString("icpcRegion");
            c.country = r.optString("country");
            c.city = r.optString("city");
            c.season = r.optString("season");
            return c;
        }

        Member decodeMember(const json& v, const std::string& path) {
            return Member{ObjectReader(v, path).string("handle")};
        }

        Party decodeParty(const json& v, const std::string& path)
        {
            ObjectReader r(v, path);
            Party p;
            p.contestId = r.optInteger("contestId");
            p.members = r.list("members", decodeMember);
            p.participantType = r.enumeration("participantType", parseParticipantType);
            p.teamId = r.optInteger("teamId");
            p.teamName = r.optString("teamName");
            p.ghost = r.boolean("ghost");
            p.room = r.optInteger("room");
            p.startTimeSeconds = r.optInteger("startTimeSeconds");
            return p;
        }

        Problem decodeProblem(const json& v, const std::string& path)
        {
            ObjectReader r(v, path);
            Problem p;
            p.contestId = r.optInteger("contestId");
            p.problemsetName = r.optString("problemsetName");
            p.index = r.optString("index");
            p.name = r.string("name");
            p.type = r.enumeration("type", parseProblemType);
            p.points = r.optNumber("points");
            p.rating = r.optInteger("rating");
            p.tags = r.strings("tags");
            return p;
        }

        ProblemStatistics decodeProblemStatistics(const json& v, const std::string& path)
        {
            ObjectReader r(v, path);
            ProblemStatistics s;
            s.contestId = r.optInteger("contestId");
            s.index = r.optString("index");
            s.solvedCount = r.integer("solvedCount");
            return s;
        }

        Problemset decodeProblemset(const json& v, const std::string& path)
        {
            ObjectReader r(v, path);
            Problemset p;
            p.problems = r.list("problems", decodeProblem);
            p.problemStatistics = r.list("problemStatistics", decodeProblemStatistics);
            return p;
        }

        Submission decodeSubmission(const json& v, const std::string& path)
        {
            ObjectReader r(v, path);
            Submission s;
            s.id = r.integer("id");
            s.contestId = r.optInteger("contestId");
            s.creationTimeSeconds = r.integer("creationTimeSeconds");
            s.relativeTimeSeconds = r.optInteger("relativeTimeSeconds");
            s.problem = r.object("problem", decodeProblem);
            s.author = r.object("author", decodeParty);
            s.programmingLanguage = r.string("programmingLanguage");
            s.verdict = r.optEnumeration("verdict", parseVerdict);
            s.testset = r.enumeration("testset", parseTestset);
            s.passedTestCount = r.integer("passedTestCount");
            s.timeConsumedMillis = r.integer("timeConsumedMillis");
            s.memoryConsumedBytes = r.integer("memoryConsumedBytes");
            s.points = r.optNumber("points");
            return s;
        }

        JudgeProtocol decodeJudgeProtocol(const json& v, const std::string& path)
        {
            ObjectReader r(v, path);
            return JudgeProtocol{r.string("manual"), r.string("protocol"), r.string("verdict")};
        }

        Hack decodeHack(const json& v, const std::string& path)
        {
            ObjectReader r(v, path);
            Hack h;
            h.id = r.integer("id");
            h.creationTimeSeconds = r.integer("creationTimeSeconds");
            h.hacker = r.object("hacker", decodeParty);
            h.defender = r.object("defender", decodeParty);
            h.verdict = r.optEnumeration("verdict", parseHackVerdict);
            h.problem = r.object("problem", decodeProblem);
            h.test = r.optString("test");
            h.judgeProtocol = r.optObject("judgeProtocol", decodeJudgeProtocol);
            return h;
        }

        ProblemResult decodeProblemResult(const json& v, const std::string& path)
        {
            ObjectReader r(v, path);
            ProblemResult p;
            p.points = r.number("points");
            p.penalty = r.optInteger("penalty");
            p.rejectedAttemptCount = r.integer("rejectedAttemptCount");
            p.type = r.enumeration("type", parseProblemResultType);
            p.bestSubmissionTimeSeconds = r.optInteger("bestSubmissionTimeSeconds");
            return p;
        }

        RanklistRow decodeRanklistRow(const json& v, const std::string& path)
        {
            ObjectReader r(v, path);
            RanklistRow row;
            row.party = r.object("party", decodeParty);
            row.rank = r.integer("rank");
            row.points = r.number("points");
            row.penalty = r.integer("penalty");
            row.successfulHackCount = r.integer("successfulHackCount");
            row.unsuccessfulHackCount = r.integer("unsuccessfulHackCount");
            row.problemResults = r.list("problemResults", decodeProblemResult);
            row.lastSubmissionTimeSeconds = r.optInteger("lastSubmissionTimeSeconds");
            return row;
        }

        ContestStandings decodeContestStandings(const json& v, const std::string& path)
        {
            ObjectReader r(v, path);
            ContestStandings s;
            s.contest = r.object("contest", decodeContest);
            s.problems = r.list("problems", decodeProblem);
            s.rows = r.list("rows", decodeRanklistRow);
            return s;
        }


        ApiResult decodeTagged(const json& v, ResultTag tag)
        {
            const std::string path = "result";

            switch (tag) {
                case ResultTag::comment_list:
                    return ApiResult::make<ResultTag::comment_list>(asList(v, path, decodeComment));
                case ResultTag::blog_entry:
                    return ApiResult::make<ResultTag::blog_entry>(decodeBlogEntry(v, path));
                case ResultTag::hack_list:
                    return ApiResult::make<ResultTag::hack_list>(asList(v, path, decodeHack));
                case ResultTag::contest_list:
                    return ApiResult::make<ResultTag::contest_list>(asList(v, path, decodeContest));
                case ResultTag::rating_change_list:
                    return ApiResult::make<ResultTag::rating_change_list>(asList(v, path, decodeRatingChange));
                case ResultTag::contest_standings:
                    return ApiResult::make<ResultTag::contest_standings>(decodeContestStandings(v, path));
                case ResultTag::submission_list:
                    return ApiResult::make<ResultTag::submission_list>(asList(v, path, decodeSubmission));
                case ResultTag::problemset:
                    return ApiResult::make<ResultTag::problemset>(decodeProblemset(v, path));
                case ResultTag::recent_action_list:
                    return ApiResult::make<ResultTag::recent_action_list>(asList(v, path, decodeRecentAction));
                case ResultTag::blog_entry_list:
                    return ApiResult::make<ResultTag::blog_entry_list>(asList(v, path, decodeBlogEntry));
                case ResultTag::handle_list:
                    return ApiResult::make<ResultTag::handle_list>(asList(v, path, asString));
                case ResultTag::user_list:
                    return ApiResult::make<ResultTag::user_list>(asList(v, path, decodeUser));
            }
            throw DecodeFailure{path, "no decoder for result tag"};
        }

    } // anonymous namespace


    Expected<Envelope> ResponseDecoder::decodeEnvelope(std::string_view body)
    {
        json root = json::parse(body, nullptr, /*allow_exceptions=*/false);

        if (root.is_discarded()) return Expected<Envelope>::failure(ErrorKind::decode, "response body is not valid JSON", "$");
        if (!root.is_object()) return Expected<Envelope>::failure(ErrorKind::decode, "response body is not a JSON object", "$");

        auto st = root.find("status");
        if (st == root.end() || !st->is_string()) {
            return Expected<Envelope>::failure(ErrorKind::decode, "missing or non-string status", "status");
        }

        Envelope env;
        const auto& status = st->get_ref<const std::string&>();
        if (status == "OK") env.status = ResponseStatus::ok;
        else if (status == "FAILED") env.status = ResponseStatus::failed;
        else return Expected<Envelope>::failure(ErrorKind::decode, "unknown status '" + status + "'", "status");

        if (auto it = root.find("comment"); it != root.end() && it->is_string()) env.comment = it->get<std::string>();
        if (auto it = root.find("result"); it != root.end()) env.result = std::move(*it);

        return Expected<Envelope>::success(std::move(env));
    }


    Expected<ApiResult> ResponseDecoder::decodeResult(const nlohmann::json& result, ResultTag tag)
    {
        try {
            return Expected<ApiResult>::success(decodeTagged(result, tag));
        } catch (const DecodeFailure& f) {
            return Expected<ApiResult>::failure(ErrorKind::decode, f.message, f.field);
        } catch (const json::exception& e) {
            return Expected<ApiResult>::failure(ErrorKind::decode, e.what(), "result");
        }
    }


    Expected<ApiResult> ResponseDecoder::decode(std::string_view body, ResultTag tag)
    {
        auto env = decodeEnvelope(body);
        if (!env.has_value()) return Expected<ApiResult>::failure(*env.error);

        auto& e = env.get();
        if (e.status == ResponseStatus::failed) {
            return Expected<ApiResult>::failure(ErrorKind::api, e.comment.value_or(std::string{}));
        }
        if (!e.result) return Expected<ApiResult>::failure(ErrorKind::decode, "missing required field 'result'", "result");

        return decodeResult(*e.result, tag);
    }


} // namespace codeforces::api
