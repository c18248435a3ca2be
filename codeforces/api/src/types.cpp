#include <array>
#include <utility>
#include "../include/types.hpp"


namespace codeforces::api {

    namespace {

        template <typename E, std::size_t N>
        using NameTable = std::array<std::pair<E, std::string_view>, N>;

        constexpr NameTable<ContestType, 3> kContestTypes{{
            {ContestType::codeforces, "CF"},
            {ContestType::ioi,        "IOI"},
            {ContestType::icpc,       "ICPC"},
        }};

        constexpr NameTable<ContestPhase, 5> kContestPhases{{
            {ContestPhase::before,              "BEFORE"},
            {ContestPhase::coding,              "CODING"},
            {ContestPhase::pending_system_test, "PENDING_SYSTEM_TEST"},
            {ContestPhase::system_test,         "SYSTEM_TEST"},
            {ContestPhase::finished,            "FINISHED"},
        }};

        constexpr NameTable<ParticipantType, 5> kParticipantTypes{{
            {ParticipantType::contestant,         "CONTESTANT"},
            {ParticipantType::practice,           "PRACTICE"},
            {ParticipantType::virtual_,           "VIRTUAL"},
            {ParticipantType::manager,            "MANAGER"},
            {ParticipantType::out_of_competition, "OUT_OF_COMPETITION"},
        }};

        constexpr NameTable<ProblemType, 2> kProblemTypes{{
            {ProblemType::programming, "PROGRAMMING"},
            {ProblemType::question,    "QUESTION"},
        }};

        constexpr NameTable<Verdict, 17> kVerdicts{{
            {Verdict::failed,                    "FAILED"},
            {Verdict::ok,                        "OK"},
            {Verdict::partial,                   "PARTIAL"},
            {Verdict::compilation_error,         "COMPILATION_ERROR"},
            {Verdict::runtime_error,             "RUNTIME_ERROR"},
            {Verdict::wrong_answer,              "WRONG_ANSWER"},
            {Verdict::presentation_error,        "PRESENTATION_ERROR"},
            {Verdict::time_limit_exceeded,       "TIME_LIMIT_EXCEEDED"},
            {Verdict::memory_limit_exceeded,     "MEMORY_LIMIT_EXCEEDED"},
            {Verdict::idleness_limit_exceeded,   "IDLENESS_LIMIT_EXCEEDED"},
            {Verdict::security_violated,         "SECURITY_VIOLATED"},
            {Verdict::crashed,                   "CRASHED"},
            {Verdict::input_preparation_crashed, "INPUT_PREPARATION_CRASHED"},
            {Verdict::challenged,                "CHALLENGED"},
            {Verdict::skipped,                   "SKIPPED"},
            {Verdict::testing,                   "TESTING"},
            {Verdict::rejected,                  "REJECTED"},
        }};

        constexpr NameTable<Testset, 14> kTestsets{{
            {Testset::samples,    "SAMPLES"},
            {Testset::pretests,   "PRETESTS"},
            {Testset::tests,      "TESTS"},
            {Testset::challenges, "CHALLENGES"},
            {Testset::tests1,     "TESTS1"},
            {Testset::tests2,     "TESTS2"},
            {Testset::tests3,     "TESTS3"},
            {Testset::tests4,     "TESTS4"},
            {Testset::tests5,     "TESTS5"},
            {Testset::tests6,     "TESTS6"},
            {Testset::tests7,     "TESTS7"},
            {Testset::tests8,     "TESTS8"},
            {Testset::tests9,     "TESTS9"},
            {Testset::tests10,    "TESTS10"},
        }};

        constexpr NameTable<HackVerdict, 8> kHackVerdicts{{
            {HackVerdict::hack_successful,       "HACK_SUCCESSFUL"},
            {HackVerdict::hack_unsuccessful,     "HACK_UNSUCCESSFUL"},
            {HackVerdict::invalid_input,         "INVALID_INPUT"},
            {HackVerdict::generator_incompilable,"GENERATOR_INCOMPILABLE"},
            {HackVerdict::generator_crashed,     "GENERATOR_CRASHED"},
            {HackVerdict::ignored,               "IGNORED"},
            {HackVerdict::testing,               "TESTING"},
            {HackVerdict::other,                 "OTHER"},
        }};

        constexpr NameTable<ProblemResultType, 2> kProblemResultTypes{{
            {ProblemResultType::preliminary, "PRELIMINARY"},
            {ProblemResultType::final_,      "FINAL"},
        }};

        constexpr NameTable<ResultTag, 12> kResultTags{{
            {ResultTag::comment_list,       "comment_list"},
            {ResultTag::blog_entry,         "blog_entry"},
            {ResultTag::hack_list,          "hack_list"},
            {ResultTag::contest_list,       "contest_list"},
            {ResultTag::rating_change_list, "rating_change_list"},
            {ResultTag::contest_standings,  "contest_standings"},
            {ResultTag::submission_list,    "submission_list"},
            {ResultTag::problemset,         "problemset"},
            {ResultTag::recent_action_list, "recent_action_list"},
            {ResultTag::blog_entry_list,    "blog_entry_list"},
            {ResultTag::handle_list,        "handle_list"},
            {ResultTag::user_list,          "user_list"},
        }};

        template <typename E, std::size_t N>
        std::optional<E> lookup(const NameTable<E, N>& table, std::string_view s) {
            for (auto const& [value, name] : table) {
                if (name == s) return value;
            }
            return std::nullopt;
        }

        template <typename E, std::size_t N>
        std::string_view nameOf(const NameTable<E, N>& table, E v) {
            for (auto const& [value, name] : table) {
                if (value == v) return name;
            }
            return "UNKNOWN";
        }

    } // anonymous namespace


    std::optional<ContestType> parseContestType(std::string_view s) { return lookup(kContestTypes, s); }
    std::optional<ContestPhase> parseContestPhase(std::string_view s) { return lookup(kContestPhases, s); }
    std::optional<ParticipantType> parseParticipantType(std::string_view s) { return lookup(kParticipantTypes, s); }
    std::optional<ProblemType> parseProblemType(std::string_view s) { return lookup(kProblemTypes, s); }
    std::optional<Verdict> parseVerdict(std::string_view s) { return lookup(kVerdicts, s); }
    std::optional<Testset> parseTestset(std::string_view s) { return lookup(kTestsets, s); }
    std::optional<HackVerdict> parseHackVerdict(std::string_view s) { return lookup(kHackVerdicts, s); }
    std::optional<ProblemResultType> parseProblemResultType(std::string_view s) { return lookup(kProblemResultTypes, s); }

    std::string_view toString(ContestType v) { return nameOf(kContestTypes, v); }
    std::string_view toString(ContestPhase v) { return nameOf(kContestPhases, v); }
    std::string_view toString(ParticipantType v) { return nameOf(kParticipantTypes, v); }
    std::string_view toString(ProblemType v) { return nameOf(kProblemTypes, v); }
    std::string_view toString(Verdict v) { return nameOf(kVerdicts, v); }
    std::string_view toString(Testset v) { return nameOf(kTestsets, v); }
    std::string_view toString(HackVerdict v) { return nameOf(kHackVerdicts, v); }
    std::string_view toString(ProblemResultType v) { return nameOf(kProblemResultTypes, v); }
    std::string_view toString(ResultTag tag) { return nameOf(kResultTags, tag); }


} // namespace codeforces::api
