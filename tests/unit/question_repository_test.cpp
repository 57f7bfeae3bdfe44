// C++ Standard Library
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

// GoogleTest
#include <gtest/gtest.h>

// Core
#include <qb/quiz/errors.hpp>
#include <qb/quiz/question_repository.hpp>

namespace fs = std::filesystem;
using quiz_bot::ConfigurationError;
using quiz_bot::JsonQuestionRepository;

namespace
{
    class TempDir
    {
    public:
        TempDir()
        {
            std::random_device rd;
            path_ = fs::temp_directory_path() / ("qb_repo_test_" + std::to_string(rd()) + "_" +
                                                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
            fs::create_directories(path_);
        }
        ~TempDir()
        {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }
        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const fs::path& path() const noexcept
        {
            return path_;
        }

        void write(const std::string& name, const std::string& content) const
        {
            std::ofstream out(path_ / name, std::ios::binary | std::ios::trunc);
            out << content;
        }

    private:
        fs::path path_;
    };

    void expect_parse_error(const std::string& json, const std::string& message)
    {
        try
        {
            (void)JsonQuestionRepository::parse_quiz(json);
            ADD_FAILURE() << "expected ConfigurationError for " << json;
        }
        catch (const ConfigurationError& e)
        {
            EXPECT_EQ(std::string{ e.what() }, message);
        }
    }
} // namespace

TEST(ParseQuiz, ReadsQuestionsAnswersAndOptions)
{
    const auto qs = JsonQuestionRepository::parse_quiz(R"({
        "quiz": [
            { "question": "2 + 2?", "answer": "4", "options": ["3", "4", "5"] },
            { "question": "Sky colour?", "answer": "Blue", "difficulty": "easy" }
        ]
    })");
    ASSERT_EQ(qs.size(), 2u);
    EXPECT_EQ(qs[0].text, "2 + 2?");
    EXPECT_EQ(qs[0].answer, "4");
    EXPECT_EQ(qs[0].options, (std::vector<std::string>{ "3", "4", "5" }));
    EXPECT_TRUE(qs[1].options.empty());
}

TEST(ParseQuiz, RejectsMalformedDocuments)
{
    expect_parse_error(R"({ "questions": [] })", "quiz data must contain a 'quiz' key");
    expect_parse_error(R"({ "quiz": [] })", "quiz array cannot be empty");
    expect_parse_error(R"({ "quiz": {} })", "'quiz' value must be an array");
    expect_parse_error(R"([1, 2])", "quiz data must be a JSON object");
    expect_parse_error(R"({ "quiz": [ { "question": "q" } ] })", "question 0 missing 'answer' field");
    expect_parse_error(R"({ "quiz": [ { "question": "q", "answer": "a" }, { "answer": "a" } ] })",
                       "question 1 missing 'question' field");
    expect_parse_error(R"({ "quiz": [ { "question": 5, "answer": "a" } ] })",
                       "question 0 'question' field must be a string");
    expect_parse_error(R"({ "quiz": [ { "question": "q", "answer": "a", "options": "abc" } ] })",
                       "question 0 'options' field must be an array");
}

TEST(ParseQuiz, ReportsSyntaxErrors)
{
    try
    {
        (void)JsonQuestionRepository::parse_quiz("{ \"quiz\": [ ");
        FAIL() << "expected ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_EQ(std::string{ e.what() }.rfind("invalid JSON: ", 0), 0u);
    }
}

TEST(JsonQuestionRepository, LoadsEveryJsonFileByStem)
{
    TempDir dir;
    dir.write("geography.json", R"({ "quiz": [ { "question": "Capital of Peru?", "answer": "Lima" } ] })");
    dir.write("maths.json", R"({ "quiz": [ { "question": "1+1?", "answer": "2" }, { "question": "2*3?", "answer": "6" } ] })");
    dir.write("notes.txt", "not a quiz");

    JsonQuestionRepository repo{ dir.path() };
    EXPECT_EQ(repo.list_names(), (std::vector<std::string>{ "geography", "maths" }));
    EXPECT_TRUE(repo.exists("maths"));
    EXPECT_FALSE(repo.exists("notes"));
    EXPECT_EQ(repo.question_count("maths"), 2u);
    EXPECT_EQ(repo.get_questions("geography").front().answer, "Lima");
    EXPECT_TRUE(repo.load_errors().empty());
    EXPECT_FALSE(repo.fallback_active());
}

TEST(JsonQuestionRepository, BrokenFilesAreSkippedAndRecorded)
{
    TempDir dir;
    dir.write("good.json", R"({ "quiz": [ { "question": "q", "answer": "a" } ] })");
    dir.write("bad.json", R"({ "quiz": [] })");

    JsonQuestionRepository repo{ dir.path() };
    EXPECT_EQ(repo.list_names(), (std::vector<std::string>{ "good" }));
    const auto errors = repo.load_errors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors.front().source, "bad.json");
    EXPECT_EQ(errors.front().reason, "quiz array cannot be empty");
}

TEST(JsonQuestionRepository, UnknownSetThrows)
{
    TempDir dir;
    JsonQuestionRepository repo{ dir.path() };
    EXPECT_THROW((void)repo.get_questions("missing"), quiz_bot::NoSuchQuestionSetError);
    EXPECT_EQ(repo.question_count("missing"), 0u);
}

TEST(JsonQuestionRepository, EmptyDirectoryGetsASample)
{
    TempDir dir;
    JsonQuestionRepository repo{ dir.path() };

    EXPECT_EQ(repo.list_names(), (std::vector<std::string>{ std::string{ JsonQuestionRepository::kSampleName } }));
    EXPECT_TRUE(fs::exists(dir.path() / "sample_quiz.json"));
    EXPECT_EQ(repo.question_count(JsonQuestionRepository::kSampleName), 3u);
    EXPECT_EQ(repo.get_questions(JsonQuestionRepository::kSampleName).back().answer, "C++");
    EXPECT_FALSE(repo.fallback_active());
}

TEST(JsonQuestionRepository, MissingDirectoryIsCreated)
{
    TempDir dir;
    const auto nested = dir.path() / "quizzes";
    JsonQuestionRepository repo{ nested };
    EXPECT_TRUE(fs::is_directory(nested));
    EXPECT_TRUE(repo.exists(JsonQuestionRepository::kSampleName));
}

TEST(JsonQuestionRepository, UnusableDirectoryFallsBackToMemory)
{
    TempDir dir;
    // A regular file where the directory should be.
    dir.write("blocked", "x");
    JsonQuestionRepository repo{ dir.path() / "blocked" };

    EXPECT_TRUE(repo.fallback_active());
    EXPECT_EQ(repo.list_names(), (std::vector<std::string>{ std::string{ JsonQuestionRepository::kFallbackName } }));
    EXPECT_FALSE(repo.load_errors().empty());
}

TEST(JsonQuestionRepository, ReloadPicksUpNewFiles)
{
    TempDir dir;
    dir.write("one.json", R"({ "quiz": [ { "question": "q", "answer": "a" } ] })");
    JsonQuestionRepository repo{ dir.path() };
    EXPECT_EQ(repo.list_names().size(), 1u);

    dir.write("two.json", R"({ "quiz": [ { "question": "q", "answer": "a" } ] })");
    EXPECT_EQ(repo.reload(), 2u);
    EXPECT_TRUE(repo.exists("two"));
}
