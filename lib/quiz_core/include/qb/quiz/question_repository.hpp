/*
Module Name:
- question_repository.hpp

Abstract:
- Named question sets the controller starts sessions from.
- JsonQuestionRepository loads every *.json file of a directory, named by file stem:
    { "quiz": [ { "question": "...", "answer": "...", "options": ["..."] }, ... ] }
- Broken files are skipped and recorded; the repository always ends up with at least
  one set (a written sample, or an in-memory fallback when the disk is unusable).
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

// Core
#include <qb/quiz/types.hpp>
#include <qb/utils/string_hash.hpp>

namespace quiz_bot
{

    class QuestionRepository
    {
    public:
        virtual ~QuestionRepository() = default;

        // Sorted.
        [[nodiscard]] virtual std::vector<std::string> list_names() const = 0;

        [[nodiscard]] virtual bool exists(std::string_view name) const = 0;

        // Throws NoSuchQuestionSetError.
        [[nodiscard]] virtual std::vector<Question> get_questions(std::string_view name) const = 0;
    };

    struct LoadError
    {
        std::string source; // file name, or the step that failed
        std::string reason;
    };

    class JsonQuestionRepository final : public QuestionRepository
    {
    public:
        static constexpr std::string_view kSampleName = "sample_quiz";
        static constexpr std::string_view kFallbackName = "fallback_quiz";

        // Loads immediately.
        explicit JsonQuestionRepository(std::filesystem::path directory);

        // Rescans the directory. Returns the number of sets now available. Never throws for bad content.
        std::size_t reload();

        [[nodiscard]] std::vector<std::string> list_names() const override;
        [[nodiscard]] bool exists(std::string_view name) const override;
        [[nodiscard]] std::vector<Question> get_questions(std::string_view name) const override;

        [[nodiscard]] std::size_t question_count(std::string_view name) const;
        [[nodiscard]] std::vector<LoadError> load_errors() const;
        [[nodiscard]] bool fallback_active() const;

        [[nodiscard]] const std::filesystem::path& directory() const noexcept
        {
            return directory_;
        }

        // Parses and validates one quiz document. Throws ConfigurationError naming the first problem.
        [[nodiscard]] static std::vector<Question> parse_quiz(std::string_view json);

    private:
        const std::filesystem::path directory_;

        mutable std::mutex mutex_; // guards everything below
        qb::StringMap<std::vector<Question>> sets_;
        std::vector<LoadError> errors_;
        bool fallback_ = false;
    };

} // namespace quiz_bot
