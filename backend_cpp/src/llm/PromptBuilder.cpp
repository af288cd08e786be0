#include "llm/PromptBuilder.hpp"
#include <filesystem>

namespace code_validation {

namespace fs = std::filesystem;

namespace {

std::string content_part(const std::string& format_prefix, const std::string& content) {
    if (content.empty()) return "";
    return format_prefix + "\"" + content + "\"\n";
}

// Artifacts are referenced by their location inside the execution folder.
std::string path_part(const std::string& format_prefix, const std::string& execution_folder, const std::string& path) {
    if (path.empty()) return "";
    fs::path located = fs::path(execution_folder) / fs::path(path).filename();
    return format_prefix + located.string() + "\n";
}

}

std::string PromptBuilder::test_folder(const std::string& execution_folder, const std::string& test_id) {
    return (fs::path(execution_folder) / ("test_" + test_id)).string();
}

std::string PromptBuilder::independent_test_prompt(const ModelArtifacts& artifacts,
                                                   const std::string& test_title,
                                                   const std::string& test_description,
                                                   const std::string& test_id) {
    const std::string& folder_root = artifacts.execution_folder;
    std::string folder = test_folder(folder_root, test_id);

    std::string prompt = "If you have a model ";
    prompt += content_part("described as: ", artifacts.documentation) + " ";
    prompt += content_part("has been trained with this code: ", artifacts.code) + " ";
    prompt += path_part("its training data used to train the model found at ", folder_root, artifacts.train_path) + " ";
    prompt += path_part("its test data used to measure the performance of the model found at ", folder_root, artifacts.test_path) + " ";
    prompt += path_part("its trained model and generated from the provided code can be found at ", folder_root, artifacts.pickle_path);
    prompt += ", implement a Python test " + test_title + ",\n";
    prompt += "described as " + test_description + ".\n\n";

    prompt += "I want you to generate a self contained Python script that will be run as a standalone Python process "
              "whose working directory is the execution folder, with no standard input. All the code has to be in one block and has to contain a call to execute the test.\n\n";
    prompt += "Please ensure the code meets the following criteria:\n\n";
    prompt += "1: The code should create the folder " + folder + " to save all the outputs\n";
    prompt += "2: Generate visualizations when possible and save them inside " + folder +
              ". Add titles to the axis and legends to all of them\n";
    prompt += "3: Add all the generated images to the reports with proper explanation of them\n";
    prompt += "4: Do proper error handling to not interrupt the execution\n";
    prompt += "5: Generate a report with Markdown called report.md, containing the results, visualizations and save it\n"
              "   inside " + folder + ". The report has to explain with detail what the test is doing\n";
    prompt += "6: All the code should be inside one single snippet of Python code\n";
    prompt += "7: All the code should be between ```python and ```\n";
    prompt += "8: Never use ``` inside the code\n";
    prompt += "9: Only print errors that have affected the execution, nothing else\n";
    prompt += "10: If an error is caught, print the message\n";
    return prompt;
}

std::string PromptBuilder::execution_error_prompt(const std::string& error,
                                                  const std::string& original_prompt,
                                                  const std::string& code) {
    return "The code generated had the following error:\n" + error +
           "\n\nOriginal conversation and context:\n" + original_prompt +
           "\n\nPlease provide a corrected version of this code:\n" + code;
}

std::string PromptBuilder::missing_folder_prompt(const std::string& original_prompt,
                                                 const std::string& folder_name,
                                                 const std::string& code) {
    return "The code executed successfully but did not create the required test folder.\n\n"
           "Original conversation and context:\n" + original_prompt +
           "\n\nThe code should create a '" + folder_name + "' folder and write results to '" +
           folder_name + "/report.md'.\n\nCurrent code:\n" + code +
           "\n\nPlease modify the code to ensure it creates the folder and report file.";
}

}
