// C++ Standard Library
#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>

// Glaze
#include <glaze/json.hpp>

// Core
#include <qb/quiz/errors.hpp>
#include <qb/quiz/question_repository.hpp>

namespace quiz_bot
{

    using json = glz::json_t;

    namespace
    {
        inline constexpr glz::opts json_opts{
            .null_terminated = true,
            .error_on_unknown_keys = false,
        };

        constexpr std::string_view sample_quiz_json = R"({
  "quiz": [
    { "question": "What is the capital of France?", "answer": "Paris" },
    { "question": "What is 2 + 2?", "answer": "4" },
    { "question": "What programming language is this bot written in?", "answer": "C++" }
  ]
}
)";

        std::vector<Question> fallback_questions()
        {
            return { Question{ "This is a fallback question. What should you do when quiz files can't be loaded?",
                               "Check the quiz directory and file permissions",
                               {} } };
        }

        std::string read_file(const std::filesystem::path& p)
        {
            std::ifstream in(p, std::ios::binary);
            if (!in)
            {
                throw ConfigurationError("cannot open file");
            }
            return std::string{ std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
        }

        const json* find_member(const json::object_t& obj, std::string_view key)
        {
            auto it = obj.find(key);
            return it == obj.end() ? nullptr : &it->second;
        }

        std::string at_question(std::size_t i, std::string_view what)
        {
            std::string msg{ "question " };
            msg.append(std::to_string(i)).append(" ").append(what);
            return msg;
        }
    } // namespace

    std::vector<Question> JsonQuestionRepository::parse_quiz(std::string_view text)
    {
        std::string buffer{ text }; // null terminated for the parser
        json doc{};
        if (auto ec = glz::read<json_opts>(doc, buffer); ec)
        {
            throw ConfigurationError("invalid JSON: " + glz::format_error(ec, buffer));
        }

        if (!doc.is_object())
        {
            throw ConfigurationError("quiz data must be a JSON object");
        }

        const json* quiz = find_member(doc.get_object(), "quiz");
        if (!quiz)
        {
            throw ConfigurationError("quiz data must contain a 'quiz' key");
        }
        if (!quiz->is_array())
        {
            throw ConfigurationError("'quiz' value must be an array");
        }

        const auto& items = quiz->get_array();
        if (items.empty())
        {
            throw ConfigurationError("quiz array cannot be empty");
        }

        std::vector<Question> out;
        out.reserve(items.size());
        for (std::size_t i = 0; i < items.size(); ++i)
        {
            const auto& item = items[i];
            if (!item.is_object())
            {
                throw ConfigurationError(at_question(i, "must be an object"));
            }
            const auto& obj = item.get_object();

            const json* q = find_member(obj, "question");
            const json* a = find_member(obj, "answer");
            if (!q)
            {
                throw ConfigurationError(at_question(i, "missing 'question' field"));
            }
            if (!a)
            {
                throw ConfigurationError(at_question(i, "missing 'answer' field"));
            }
            if (!q->is_string())
            {
                throw ConfigurationError(at_question(i, "'question' field must be a string"));
            }
            if (!a->is_string())
            {
                throw ConfigurationError(at_question(i, "'answer' field must be a string"));
            }

            Question parsed{ q->get_string(), a->get_string(), {} };

            if (const json* opts = find_member(obj, "options"))
            {
                if (!opts->is_array())
                {
                    throw ConfigurationError(at_question(i, "'options' field must be an array"));
                }
                for (const auto& o : opts->get_array())
                {
                    if (!o.is_string())
                    {
                        throw ConfigurationError(at_question(i, "'options' entries must be strings"));
                    }
                    parsed.options.push_back(o.get_string());
                }
            }

            out.push_back(std::move(parsed));
        }
        return out;
    }

    JsonQuestionRepository::JsonQuestionRepository(std::filesystem::path directory) :
        directory_{ std::move(directory) }
    {
        reload();
    }

    std::size_t JsonQuestionRepository::reload()
    {
        namespace fs = std::filesystem;

        qb::StringMap<std::vector<Question>> sets;
        std::vector<LoadError> errors;
        bool fallback = false;

        // 1) Directory
        std::error_code ec;
        bool usable = fs::is_directory(directory_, ec);
        if (!usable)
        {
            ec.clear();
            fs::create_directories(directory_, ec);
            if (ec)
            {
                errors.push_back({ directory_.string(), "cannot create quiz directory: " + ec.message() });
            }
            else
            {
                std::cout << "[Questions] created quiz directory " << directory_ << '\n';
                usable = true;
            }
        }

        // 2) Every *.json file, in name order so the log reads predictably
        if (usable)
        {
            std::vector<fs::path> files;
            for (fs::directory_iterator it{ directory_, ec }, end; !ec && it != end; it.increment(ec))
            {
                std::error_code type_ec;
                if (it->is_regular_file(type_ec) && it->path().extension() == ".json")
                {
                    files.push_back(it->path());
                }
            }
            if (ec)
            {
                errors.push_back({ directory_.string(), "cannot scan quiz directory: " + ec.message() });
            }
            std::sort(files.begin(), files.end());

            for (const auto& file : files)
            {
                try
                {
                    auto questions = parse_quiz(read_file(file));
                    std::cout << "[Questions] loaded " << file.filename().string() << " (" << questions.size()
                              << " questions)\n";
                    sets.insert_or_assign(file.stem().string(), std::move(questions));
                }
                catch (const ConfigurationError& e)
                {
                    std::cerr << "[Questions] skipped " << file.filename().string() << ": " << e.what() << '\n';
                    errors.push_back({ file.filename().string(), e.what() });
                }
            }
        }

        // 3) Nothing usable on disk: write a sample next to the user's files
        if (sets.empty() && usable)
        {
            const auto sample_path = directory_ / (std::string{ kSampleName } + ".json");
            bool written = fs::exists(sample_path, ec);
            if (!written)
            {
                std::ofstream out(sample_path, std::ios::binary | std::ios::trunc);
                out << sample_quiz_json;
                written = static_cast<bool>(out);
                if (written)
                {
                    std::cout << "[Questions] created sample quiz " << sample_path << '\n';
                }
                else
                {
                    errors.push_back({ sample_path.filename().string(), "cannot write sample quiz" });
                }
            }
            if (written)
            {
                sets.insert_or_assign(std::string{ kSampleName }, parse_quiz(sample_quiz_json));
            }
        }

        // 4) Last resort: keep the bot usable from memory
        if (sets.empty())
        {
            std::cerr << "[Questions] no quiz could be loaded from " << directory_ << ", using the fallback quiz\n";
            sets.insert_or_assign(std::string{ kFallbackName }, fallback_questions());
            fallback = true;
        }

        std::lock_guard lk(mutex_);
        sets_ = std::move(sets);
        errors_ = std::move(errors);
        fallback_ = fallback;
        std::cout << "[Questions] " << sets_.size() << " quiz set(s) available, " << errors_.size()
                  << " load error(s)\n";
        return sets_.size();
    }

    std::vector<std::string> JsonQuestionRepository::list_names() const
    {
        std::vector<std::string> names;
        {
            std::lock_guard lk(mutex_);
            names.reserve(sets_.size());
            for (const auto& [name, _] : sets_)
            {
                names.push_back(name);
            }
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    bool JsonQuestionRepository::exists(std::string_view name) const
    {
        std::lock_guard lk(mutex_);
        return sets_.find(name) != sets_.end();
    }

    std::vector<Question> JsonQuestionRepository::get_questions(std::string_view name) const
    {
        std::lock_guard lk(mutex_);
        auto it = sets_.find(name);
        if (it == sets_.end())
        {
            throw NoSuchQuestionSetError("no quiz named '" + std::string{ name } + "'");
        }
        return it->second;
    }

    std::size_t JsonQuestionRepository::question_count(std::string_view name) const
    {
        std::lock_guard lk(mutex_);
        auto it = sets_.find(name);
        return it == sets_.end() ? 0 : it->second.size();
    }

    std::vector<LoadError> JsonQuestionRepository::load_errors() const
    {
        std::lock_guard lk(mutex_);
        return errors_;
    }

    bool JsonQuestionRepository::fallback_active() const
    {
        std::lock_guard lk(mutex_);
        return fallback_;
    }

} // namespace quiz_bot
