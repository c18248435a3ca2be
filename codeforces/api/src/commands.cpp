#include "../include/commands.hpp"


namespace codeforces::api::commands {

    namespace {

        // Collects parameters and keeps the first failure.
        class ParamBuilder
        {
        public:
            template <typename T>
            ParamBuilder& add(const char* name, T value) {
                if (error_) return *this;
                auto r = params_.add(name, ParamValue{std::move(value)});
                if (!r.has_value()) error_ = r.error;
                return *this;
            }

            template <typename T>
            ParamBuilder& optional(const char* name, const std::optional<T>& value) {
                if (value) add(name, *value);
                return *this;
            }

            ParamBuilder& list(const char* name, const std::vector<std::string>& items) {
                if (items.empty()) return fail(std::string(name) + " must not be empty");
                for (const auto& item : items) {
                    if (item.empty()) return fail(std::string(name) + " contains an empty entry");
                }
                return add(name, ParamList{items, kListSeparator});
            }

            ParamBuilder& optionalList(const char* name, const std::optional<std::vector<std::string>>& items) {
                if (items) list(name, *items);
                return *this;
            }

            ParamBuilder& nonEmpty(const char* name, const std::string& value) {
                if (value.empty()) return fail(std::string(name) + " must not be empty");
                return add(name, value);
            }

            // Unset is omitted; set but empty is an error, as for required strings.
            ParamBuilder& optionalNonEmpty(const char* name, const std::optional<std::string>& value) {
                if (value) nonEmpty(name, *value);
                return *this;
            }

            Expected<ParamMap> done() {
                if (error_) return Expected<ParamMap>::failure(*error_);
                return Expected<ParamMap>::success(std::move(params_));
            }

        private:
            ParamBuilder& fail(std::string msg) {
                if (!error_) error_ = Error{ErrorKind::invalid_parameter, std::move(msg), {}};
                return *this;
            }

            ParamMap params_;
            std::optional<Error> error_;
        };

    } // anonymous namespace


    Expected<ParamMap> BlogEntryComments::parameters() const {
        return ParamBuilder{}.add("blogEntryId", blogEntryId).done();
    }

    Expected<ParamMap> BlogEntryView::parameters() const {
        return ParamBuilder{}.add("blogEntryId", blogEntryId).done();
    }


    Expected<ParamMap> ContestHacks::parameters() const {
        return ParamBuilder{}.add("contestId", contestId).done();
    }

    Expected<ParamMap> ContestList::parameters() const {
        return ParamBuilder{}.optional("gym", gym).done();
    }

    Expected<ParamMap> ContestRatingChanges::parameters() const {
        return ParamBuilder{}.add("contestId", contestId).done();
    }

    Expected<ParamMap> ContestStandings::parameters() const
    {
        return ParamBuilder{}
            .add("contestId", contestId)
            .optional("from", from)
            .optional("count", count)
            .optionalList("handles", handles)
            .optional("room", room)
            .optional("showUnofficial", showUnofficial)
            .done();
    }

    Expected<ParamMap> ContestStatus::parameters() const
    {
        return ParamBuilder{}
            .add("contestId", contestId)
            .optionalNonEmpty("handle", handle)
            .optional("from", from)
            .optional("count", count)
            .done();
    }


    Expected<ParamMap> ProblemsetProblems::parameters() const {
        return ParamBuilder{}.optionalList("tags", tags).optionalNonEmpty("problemsetName", problemsetName).done();
    }

    Expected<ParamMap> ProblemsetRecentStatus::parameters() const {
        return ParamBuilder{}.add("count", count).optionalNonEmpty("problemsetName", problemsetName).done();
    }


    Expected<ParamMap> RecentActions::parameters() const {
        return ParamBuilder{}.add("maxCount", maxCount).done();
    }


    Expected<ParamMap> UserBlogEntries::parameters() const {
        return ParamBuilder{}.nonEmpty("handle", handle).done();
    }

    Expected<ParamMap> UserFriends::parameters() const {
        return ParamBuilder{}.optional("onlyOnline", onlyOnline).done();
    }

    Expected<ParamMap> UserInfo::parameters() const {
        return ParamBuilder{}.list("handles", handles).done();
    }

    Expected<ParamMap> UserRatedList::parameters() const {
        return ParamBuilder{}.optional("activeOnly", activeOnly).done();
    }

    Expected<ParamMap> UserRating::parameters() const {
        return ParamBuilder{}.nonEmpty("handle", handle).done();
    }

    Expected<ParamMap> UserStatus::parameters() const
    {
        return ParamBuilder{}
            .nonEmpty("handle", handle)
            .optional("from", from)
            .optional("count", count)
            .done();
    }


} // namespace codeforces::api::commands
