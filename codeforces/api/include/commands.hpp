#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "command.hpp"


namespace codeforces::api::commands {

    // Codeforces joins handle and tag lists with ';'
    inline constexpr char kListSeparator = ';';


    // ---- blogEntry.* ----

    struct BlogEntryComments final : ICommand
    {
        static constexpr std::string_view kMethod = "blogEntry.comments";

        std::int64_t blogEntryId{0};

        explicit BlogEntryComments(std::int64_t id = 0) : blogEntryId(id) {}

        std::string_view methodName() const override { return kMethod; }
        Expected<ParamMap> parameters() const override;
        ResultTag expectedResultTag() const override { return ResultTag::comment_list; }
    };


    struct BlogEntryView final : ICommand
    {
        static constexpr std::string_view kMethod = "blogEntry.view";

        std::int64_t blogEntryId{0};

        explicit BlogEntryView(std::int64_t id = 0) : blogEntryId(id) {}

        std::string_view methodName() const override { return kMethod; }
        Expected<ParamMap> parameters() const override;
        ResultTag expectedResultTag() const override { return ResultTag::blog_entry; }
    };


    // ---- contest.* ----

    // Full information about hacks is only available some time after the contest ends.
    struct ContestHacks final : ICommand
    {
        static constexpr std::string_view kMethod = "contest.hacks";

        std::int64_t contestId{0};

        explicit ContestHacks(std::int64_t id = 0) : contestId(id) {}

        std::string_view methodName() const override { return kMethod; }
        Expected<ParamMap> parameters() const override;
        ResultTag expectedResultTag() const override { return ResultTag::hack_list; }
    };


    struct ContestList final : ICommand
    {
        static constexpr std::string_view kMethod = "contest.list";

        std::optional<bool> gym; // true: gym contests only

        std::string_view methodName() const override { return kMethod; }
        Expected<ParamMap> parameters() const override;
        ResultTag expectedResultTag() const override { return ResultTag::contest_list; }
    };


    struct ContestRatingChanges final : ICommand
    {
        static constexpr std::string_view kMethod = "contest.ratingChanges";

        std::int64_t contestId{0};

        explicit ContestRatingChanges(std::int64_t id = 0) : contestId(id) {}

        std::string_view methodName() const override { return kMethod; }
        Expected<ParamMap> parameters() const override;
        ResultTag expectedResultTag() const override { return ResultTag::rating_change_list; }
    };


    struct ContestStandings final : ICommand
    {
        static constexpr std::string_view kMethod = "contest.standings";

        std::int64_t contestId{0};
        std::optional<std::int64_t> from;   // 1-based
        std::optional<std::int64_t> count;
        std::optional<std::vector<std::string>> handles;
        std::optional<std::int64_t> room;
        std::optional<bool> showUnofficial;

        std::string_view methodName() const override { return kMethod; }
        Expected<ParamMap> parameters() const override;
        ResultTag expectedResultTag() const override { return ResultTag::contest_standings; }
    };


    struct ContestStatus final : ICommand
    {
        static constexpr std::string_view kMethod = "contest.status";

        std::int64_t contestId{0};
        std::optional<std::string> handle;
        std::optional<std::int64_t> from;
        std::optional<std::int64_t> count;

        std::string_view methodName() const override { return kMethod; }
        Expected<ParamMap> parameters() const override;
        ResultTag expectedResultTag() const override { return ResultTag::submission_list; }
    };


    // ---- problemset.* ----

    struct ProblemsetProblems final : ICommand
    {
        static constexpr std::string_view kMethod = "problemset.problems";

        std::optional<std::vector<std::string>> tags;
        std::optional<std::string> problemsetName; // e.g. "acmsguru"

        std::string_view methodName() const override { return kMethod; }
        Expected<ParamMap> parameters() const override;
        ResultTag expectedResultTag() const override { return ResultTag::problemset; }
    };


    struct ProblemsetRecentStatus final : ICommand
    {
        static constexpr std::string_view kMethod = "problemset.recentStatus";

        std::int64_t count{0}; // at most 1000
        std::optional<std::string> problemsetName;

        std::string_view methodName() const override { return kMethod; }
        Expected<ParamMap> parameters() const override;
        ResultTag expectedResultTag() const override { return ResultTag::submission_list; }
    };


    // ---- recentActions ----

    struct RecentActions final : ICommand
    {
        static constexpr std::string_view kMethod = "recentActions";

        std::int64_t maxCount{0}; // at most 100

        explicit RecentActions(std::int64_t n = 0) : maxCount(n) {}

        std::string_view methodName() const override { return kMethod; }
        Expected<ParamMap> parameters() const override;
        ResultTag expectedResultTag() const override { return ResultTag::recent_action_list; }
    };


    // ---- user.* ----

    struct UserBlogEntries final : ICommand
    {
        static constexpr std::string_view kMethod = "user.blogEntries";

        std::string handle;

        explicit UserBlogEntries(std::string h = {}) : handle(std::move(h)) {}

        std::string_view methodName() const override { return kMethod; }
        Expected<ParamMap> parameters() const override;
        ResultTag expectedResultTag() const override { return ResultTag::blog_entry_list; }
    };


    // Friends of the user owning the API key.
    struct UserFriends final : ICommand
    {
        static constexpr std::string_view kMethod = "user.friends";

        std::optional<bool> onlyOnline;

        std::string_view methodName() const override { return kMethod; }
        Expected<ParamMap> parameters() const override;
        ResultTag expectedResultTag() const override { return ResultTag::handle_list; }
    };


    struct UserInfo final : ICommand
    {
        static constexpr std::string_view kMethod = "user.info";

        std::vector<std::string> handles; // at most 10000

        explicit UserInfo(std::vector<std::string> h = {}) : handles(std::move(h)) {}

        std::string_view methodName() const override { return kMethod; }
        Expected<ParamMap> parameters() const override;
        ResultTag expectedResultTag() const override { return ResultTag::user_list; }
    };


    struct UserRatedList final : ICommand
    {
        static constexpr std::string_view kMethod = "user.ratedList";

        std::optional<bool> activeOnly;

        std::string_view methodName() const override { return kMethod; }
        Expected<ParamMap> parameters() const override;
        ResultTag expectedResultTag() const override { return ResultTag::user_list; }
    };


    struct UserRating final : ICommand
    {
        static constexpr std::string_view kMethod = "user.rating";

        std::string handle;

        explicit UserRating(std::string h = {}) : handle(std::move(h)) {}

        std::string_view methodName() const override { return kMethod; }
        Expected<ParamMap> parameters() const override;
        ResultTag expectedResultTag() const override { return ResultTag::rating_change_list; }
    };


    struct UserStatus final : ICommand
    {
        static constexpr std::string_view kMethod = "user.status";

        std::string handle;
        std::optional<std::int64_t> from;
        std::optional<std::int64_t> count;

        std::string_view methodName() const override { return kMethod; }
        Expected<ParamMap> parameters() const override;
        ResultTag expectedResultTag() const override { return ResultTag::submission_list; }
    };


} // namespace codeforces::api::commands
