#pragma once
#include <string>

namespace code_validation {

// What the generated tests may look at. Paths are where the files live on the
// sandbox host; documentation and code are inlined into the prompt.
struct ModelArtifacts {
    std::string documentation;
    std::string code;
    std::string train_path;
    std::string test_path;
    std::string pickle_path;
    std::string execution_folder;
};

class PromptBuilder {
public:
    // `<execution_folder>/test_<id>`
    static std::string test_folder(const std::string& execution_folder, const std::string& test_id);

    static std::string independent_test_prompt(const ModelArtifacts& artifacts,
                                               const std::string& test_title,
                                               const std::string& test_description,
                                               const std::string& test_id);

    static std::string execution_error_prompt(const std::string& error,
                                              const std::string& original_prompt,
                                              const std::string& code);

    static std::string missing_folder_prompt(const std::string& original_prompt,
                                             const std::string& folder_name,
                                             const std::string& code);
};

}
