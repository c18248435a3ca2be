#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>


namespace codeforces::api {


    enum class ContestType { codeforces, ioi, icpc };

    enum class ContestPhase { before, coding, pending_system_test, system_test, finished };

    enum class ParticipantType { contestant, practice, virtual_, manager, out_of_competition };

    enum class ProblemType { programming, question };

    enum class Verdict {
        failed, ok, partial, compilation_error, runtime_error, wrong_answer,
        presentation_error, time_limit_exceeded, memory_limit_exceeded,
        idleness_limit_exceeded, security_violated, crashed,
        input_preparation_crashed, challenged, skipped, testing, rejected
    };

    enum class Testset {
        samples, pretests, tests, challenges,
        tests1, tests2, tests3, tests4, tests5, tests6, tests7, tests8, tests9, tests10
    };

    enum class HackVerdict {
        hack_successful, hack_unsuccessful, invalid_input, generator_incompilable,
        generator_crashed, ignored, testing, other
    };

    enum class ProblemResultType { preliminary, final_ };


    // Wire spelling ("CF", "PENDING_SYSTEM_TEST", "TESTS3", ...) to enum and back.
    std::optional<ContestType> parseContestType(std::string_view s);
    std::optional<ContestPhase> parseContestPhase(std::string_view s);
    std::optional<ParticipantType> parseParticipantType(std::string_view s);
    std::optional<ProblemType> parseProblemType(std::string_view s);
    std::optional<Verdict> parseVerdict(std::string_view s);
    std::optional<Testset> parseTestset(std::string_view s);
    std::optional<HackVerdict> parseHackVerdict(std::string_view s);
    std::optional<ProblemResultType> parseProblemResultType(std::string_view s);

    std::string_view toString(ContestType v);
    std::string_view toString(ContestPhase v);
    std::string_view toString(ParticipantType v);
    std::string_view toString(ProblemType v);
    std::string_view toString(Verdict v);
    std::string_view toString(Testset v);
    std::string_view toString(HackVerdict v);
    std::string_view toString(ProblemResultType v);


    struct User
    {
        std::string handle;
        std::optional<std::string> email;
        std::optional<std::string> vkId;
        std::optional<std::string> openId;
        std::optional<std::string> firstName;
        std::optional<std::string> lastName;
        std::optional<std::string> country;
        std::optional<std::string> city;
        std::optional<std::string> organization;
        std::int64_t contribution{0};
        std::optional<std::string> rank;
        std::optional<std::int64_t> rating;
        std::optional<std::string> maxRank;
        std::optional<std::int64_t> maxRating;
        std::int64_t lastOnlineTimeSeconds{0};
        std::int64_t registrationTimeSeconds{0};
        std::int64_t friendOfCount{0};
        std::string avatar;
        std::string titlePhoto;
    };


    struct BlogEntry
    {
        std::int64_t id{0};
        std::string originalLocale;
        std::int64_t creationTimeSeconds{0};
        std::string authorHandle;
        std::string title;
        std::optional<std::string> content; // only present in blogEntry.view
        std::string locale;
        std::int64_t modificationTimeSeconds{0};
        bool allowViewHistory{false};
        std::vector<std::string> tags;
        std::int64_t rating{0};
    };


    struct Comment
    {
        std::int64_t id{0};
        std::int64_t creationTimeSeconds{0};
        std::string commentatorHandle;
        std::string locale;
        std::string text;
        std::optional<std::int64_t> parentCommentId;
        std::int64_t rating{0};
    };


    struct RecentAction
    {
        std::int64_t timeSeconds{0};
        std::optional<BlogEntry> blogEntry;
        std::optional<Comment> comment;
    };


    struct RatingChange
    {
        std::int64_t contestId{0};
        std::string contestName;
        std::string handle;
        std::int64_t rank{0};
        std::int64_t ratingUpdateTimeSeconds{0};
        std::int64_t oldRating{0};
        std::int64_t newRating{0};
    };


    struct Contest
    {
        std::int64_t id{0};
        std::string name;
        ContestType type{ContestType::codeforces};
        ContestPhase phase{ContestPhase::before};
        std::int64_t durationSeconds{0};
        std::optional<std::int64_t> startTimeSeconds;
        std::optional<std::int64_t> relativeTimeSeconds;
        std::optional<std::string> preparedBy;
        std::optional<std::string> websiteUrl;
        std::optional<std::string> description;
        std::optional<std::int64_t> difficulty;
        std::optional<std::string> kind;
        std::optional<std::string> icpcRegion;
        std::optional<std::string> country;
        std::optional<std::string> city;
        std::optional<std::string> season;
    };


    struct Member
    {
        std::string handle;
    };


    struct Party
    {
        std::optional<std::int64_t> contestId;
        std::vector<Member> members;
        ParticipantType participantType{ParticipantType::contestant};
        std::optional<std::int64_t> teamId;
        std::optional<std::string> teamName;
        bool ghost{false};
        std::optional<std::int64_t> room;
        std::optional<std::int64_t> startTimeSeconds;
    };


    struct Problem
    {
        std::optional<std::int64_t> contestId;
        std::optional<std::string> problemsetName;
        std::optional<std::string> index;
        std::string name;
        ProblemType type{ProblemType::programming};
        std::optional<double> points;
        std::optional<std::int64_t> rating;
        std::vector<std::string> tags;
    };


    struct ProblemStatistics
    {
        std::optional<std::int64_t> contestId;
        std::optional<std::string> index;
        std::int64_t solvedCount{0};
    };


    struct Problemset
    {
        std::vector<Problem> problems;
        std::vector<ProblemStatistics> problemStatistics;
    };


    struct Submission
    {
        std::int64_t id{0};
        std::optional<std::int64_t> contestId;
        std::int64_t creationTimeSeconds{0};
        std::optional<std::int64_t> relativeTimeSeconds;
        Problem problem;
        Party author;
        std::string programmingLanguage;
        std::optional<Verdict> verdict; // absent while the submission is queued
        Testset testset{Testset::tests};
        std::int64_t passedTestCount{0};
        std::int64_t timeConsumedMillis{0};
        std::int64_t memoryConsumedBytes{0};
        std::optional<double> points;
    };


    struct JudgeProtocol
    {
        std::string manual;
        std::string protocol;
        std::string verdict;
    };


    struct Hack
    {
        std::int64_t id{0};
        std::int64_t creationTimeSeconds{0};
        Party hacker;
        Party defender;
        std::optional<HackVerdict> verdict;
        Problem problem;
        std::optional<std::string> test;
        std::optional<JudgeProtocol> judgeProtocol;
    };


    struct ProblemResult
    {
        double points{0.0};
        std::optional<std::int64_t> penalty;
        std::int64_t rejectedAttemptCount{0};
        ProblemResultType type{ProblemResultType::final_};
        std::optional<std::int64_t> bestSubmissionTimeSeconds;
    };


    struct RanklistRow
    {
        Party party;
        std::int64_t rank{0};
        double points{0.0};
        std::int64_t penalty{0};
        std::int64_t successfulHackCount{0};
        std::int64_t unsuccessfulHackCount{0};
        std::vector<ProblemResult> problemResults;
        std::optional<std::int64_t> lastSubmissionTimeSeconds;
    };


    struct ContestStandings
    {
        Contest contest;
        std::vector<Problem> problems;
        std::vector<RanklistRow> rows;
    };


    // Order matches the alternatives of ApiResult::Payload.
    enum class ResultTag {
        comment_list,
        blog_entry,
        hack_list,
        contest_list,
        rating_change_list,
        contest_standings,
        submission_list,
        problemset,
        recent_action_list,
        blog_entry_list,
        handle_list,
        user_list
    };

    std::string_view toString(ResultTag tag);


    /**
     * @brief Decoded payload of a successful API call.
     *
     * One alternative per result shape; tag() names the alternative held.
     * Use get<T>() to pattern-match:
     *
     *   if (auto* entry = result.get<BlogEntry>()) { ... }
     */
    class ApiResult
    {
    public:
        using Payload = std::variant<
            std::vector<Comment>,
            BlogEntry,
            std::vector<Hack>,
            std::vector<Contest>,
            std::vector<RatingChange>,
            ContestStandings,
            std::vector<Submission>,
            Problemset,
            std::vector<RecentAction>,
            std::vector<BlogEntry>,
            std::vector<std::string>,
            std::vector<User>>;

        static_assert(std::variant_size_v<Payload> == static_cast<std::size_t>(ResultTag::user_list) + 1,
            "every ResultTag needs a payload alternative");

        ApiResult() = default;

        // Emplaces the alternative whose index is Tag.
        template <ResultTag Tag, typename T>
        static ApiResult make(T&& value) {
            ApiResult r;
            r.payload_.template emplace<static_cast<std::size_t>(Tag)>(std::forward<T>(value));
            return r;
        }

        ResultTag tag() const noexcept { return static_cast<ResultTag>(payload_.index()); }

        template <typename T> T* get() noexcept { return std::get_if<T>(&payload_); }
        template <typename T> const T* get() const noexcept { return std::get_if<T>(&payload_); }

        const Payload& payload() const noexcept { return payload_; }

    private:
        Payload payload_;
    };


} // namespace codeforces::api
