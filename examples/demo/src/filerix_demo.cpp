/**
 * filerix Demo
 * ============
 * Walks through the file operations: config, temp file, create, read, delete.
 */

#include <filerix/filerix.hpp>
#include <spdlog/spdlog.h>

#include <iostream>

void print_separator() {
    std::cout << std::string(60, '-') << "\n";
}

int main(int argc, char* argv[]) {
    // Load config (FILERIX_CONFIG or builtin), or an explicit file
    auto config = argc > 1 ? filerix::load_config(argv[1]) : filerix::resolve_config();
    if (!config.ok) {
        std::cerr << "Error: " << config.error << "\n";
        return 1;
    }
    for (const auto& w : config.warnings) {
        spdlog::warn("config: {}", w);
    }
    filerix::apply_config(config.config);

    std::cout << "filerix Demo " << filerix::FILERIX_VERSION << "\n";
    std::cout << "=================\n\n";
    std::cout << "Platform: " << filerix::platform_to_string(filerix::get_current_platform())
              << "\n\n";

    // Scratch file
    print_separator();
    std::cout << "Temp file:\n";
    print_separator();

    auto temp = filerix::create_temp_file(config.config.temp);
    if (!temp.ok) {
        std::cerr << "Error: " << temp.error.message() << "\n";
        return 1;
    }
    const std::string path = temp.value.path();
    std::cout << "  " << path << "\n\n";

    // Structured content is written as JSON text
    print_separator();
    std::cout << "Create:\n";
    print_separator();

    filerix::ContentValue record;
    record["name"] = "demo";
    record["items"] = filerix::ContentValue::array({1, 2, 3});
    record["done"] = false;

    auto created = filerix::create_file(path, record, config.config.create);
    if (!created.ok) {
        std::cerr << "Error: " << created.error.message() << "\n";
        return 1;
    }
    std::cout << "  wrote " << created.value << "\n\n";

    print_separator();
    std::cout << "Read:\n";
    print_separator();

    auto content = filerix::read_file(path, config.config.read);
    if (!content.ok) {
        std::cerr << "Error: " << content.error.message() << "\n";
        return 1;
    }
    std::cout << content.value.text << "\n\n";

    auto readonly = filerix::is_readonly(path);
    if (readonly.ok) {
        std::cout << "  read-only: " << (readonly.value ? "yes" : "no") << "\n";
    }

    // Unsupported content is rejected before anything is written
    auto rejected = filerix::create_file(path, filerix::opaque_content());
    std::cout << "  opaque content: " << rejected.error.message() << "\n\n";

    print_separator();
    std::cout << "Delete:\n";
    print_separator();

    auto deleted = filerix::delete_file(path);
    if (!deleted.ok) {
        std::cerr << "Error: " << deleted.error.message() << "\n";
        return 1;
    }
    std::cout << "  removed: " << (deleted.value ? "yes" : "no") << "\n";

    auto again = filerix::delete_file(path, true);
    std::cout << "  removed again: " << (again.ok && again.value ? "yes" : "no") << "\n";

    return 0;
}
