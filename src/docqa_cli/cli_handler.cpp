#include "docqa_cli/cli_handler.hpp"
#include <fstream>
#include <iostream>
#include <iomanip> // Required for std::fixed and std::setprecision
#include <memory>
#include <sstream>

namespace docqa_cli {

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "upload" || command == "u") {
        options.command = Command::Upload;
        for (int i = 2; i < argc; i += 2) {
            if (i + 1 >= argc) break;
            std::string flag = argv[i];
            std::string value = argv[i + 1];

            if (flag == "--file" || flag == "-f") {
                options.file_path = value;
            }
        }
        if (options.file_path.empty()) {
            throw CliError("Upload command requires a file path. Usage: upload --file <path>");
        }
    } else if (command == "ask" || command == "a") {
        options.command = Command::Ask;
        for (int i = 2; i < argc; i += 2) {
            if (i + 1 >= argc) break;
            std::string flag = argv[i];
            std::string value = argv[i + 1];

            if (flag == "--question" || flag == "-q") {
                options.question = value;
            } else if (flag == "--document" || flag == "-d") {
                options.document_id = value;
            }
        }
        if (options.question.empty()) {
            throw CliError("Ask command requires a question. Usage: ask --question <text>");
        }
    } else if (command == "status" || command == "s") {
        options.command = Command::Status;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

bool CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Upload:
            return handle_upload_command(options);
        case Command::Ask:
            return handle_ask_command(options);
        case Command::Status:
            return handle_status_command(options);
        case Command::Help:
            print_help();
            return true;
    }
    return false;
}

bool CliHandler::handle_upload_command(const CliOptions& options) {
    std::cout << "Uploading document: " << options.file_path << std::endl;

    try {
        std::string content = read_file(options.file_path);
        char* escaped_name = curl_easy_escape(curl_handle_, options.file_path.c_str(),
                                              static_cast<int>(options.file_path.size()));
        std::string endpoint = "/documents?name=" + std::string(escaped_name ? escaped_name : "upload");
        curl_free(escaped_name);

        nlohmann::json response = make_post_request(endpoint, content, "text/plain; charset=utf-8");
        const auto& data = response["data"];
        std::cout << "Document loaded: " << data.value("chunk_count", 0) << " chunks (id "
                  << data.value("document_id", std::string("?")) << ")" << std::endl;
        return true;
    } catch (const std::exception& e) {
        print_error("Failed to upload document: " + std::string(e.what()));
        return false;
    }
}

bool CliHandler::handle_ask_command(const CliOptions& options) {
    nlohmann::json request_data = {
        {"question", options.question}
    };
    if (!options.document_id.empty()) {
        request_data["document_id"] = options.document_id;
    }

    try {
        nlohmann::json response = make_post_request("/ask", request_data.dump(), "application/json");
        print_answer_response(response);
        return true;
    } catch (const std::exception& e) {
        print_error("Failed to answer question: " + std::string(e.what()));
        return false;
    }
}

bool CliHandler::handle_status_command(const CliOptions& options) {
    try {
        nlohmann::json health = make_get_request("/");
        std::cout << "Server: " << health.value("status", std::string("unknown")) << std::endl;
        try {
            nlohmann::json document = make_get_request("/documents/current");
            std::cout << "Document: " << document.value("name", std::string("?")) << " (id "
                      << document.value("document_id", std::string("?")) << ", "
                      << document.value("chunk_count", 0) << " chunks)" << std::endl;
        } catch (const HttpError& e) {
            if (e.status_code() != 404) {
                throw;
            }
            std::cout << "Document: none loaded" << std::endl;
        }
        return true;
    } catch (const std::exception& e) {
        print_error("Failed to get status: " + std::string(e.what()));
        return false;
    }
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    curl_easy_reset(curl_handle_);
    return perform_request(url);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const std::string& body,
                                             const std::string& content_type) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string content_type_header = "Content-Type: " + content_type;
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
        curl_slist_append(nullptr, content_type_header.c_str()), &curl_slist_free_all);

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
    return perform_request(url);
}

nlohmann::json CliHandler::perform_request(const std::string& url) {
    std::string response_buffer;
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        auto error_json = nlohmann::json::parse(response_buffer, nullptr, false);
        std::string detail = (!error_json.is_discarded() && error_json.is_object() &&
                              error_json.contains("error") && error_json["error"].is_string())
                                 ? error_json["error"].get<std::string>()
                                 : response_buffer;
        throw HttpError(http_code, detail);
    }

    return nlohmann::json::parse(response_buffer);
}

std::string CliHandler::read_file(const std::string& path) {
    std::ifstream file_stream(path, std::ios::binary);
    if (!file_stream.is_open()) {
        throw CliError("Could not open file: " + path);
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    return buffer.str();
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

void CliHandler::print_answer_response(const nlohmann::json& response) {
    std::cout << "\nAnswer: " << response.value("answer", std::string()) << std::endl;

    std::string preview = response.value("context_preview", std::string());
    if (!preview.empty()) {
        std::cout << "\nContext: " << preview << "..." << std::endl;
    }

    if (response.contains("chunks") && response["chunks"].is_array()) {
        std::cout << "\nRetrieved chunks:" << std::endl;
        for (const auto& chunk : response["chunks"]) {
            std::cout << "  #" << chunk["chunk_index"].get<int>()
                      << " (distance: " << std::fixed << std::setprecision(4)
                      << chunk["distance"].get<float>() << ")" << std::endl;
        }
    }
}

void CliHandler::print_error(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    std::cout << "DocQA CLI - ask questions about an uploaded text document\n\n"
              << "Usage: docqa_cli <command> [options]\n\n"
              << "Commands:\n"
              << "  upload, u    Upload a UTF-8 text file (replaces the current document)\n"
              << "               --file, -f <path>\n"
              << "  ask, a       Ask a question about the current document\n"
              << "               --question, -q <text>\n"
              << "               --document, -d <id>   fail if another document is loaded\n"
              << "  status, s    Show server health and the loaded document\n"
              << "  help, h      Show this help\n\n"
              << "Environment:\n"
              << "  API_BASE_URL  Server address (default http://127.0.0.1:3030)\n";
}

std::string CliHandler::build_url(const std::string& endpoint) {
    std::string base_url = api_base_url_;
    if (!base_url.empty() && base_url.back() == '/') {
        base_url.pop_back();
    }
    return base_url + endpoint;
}

}  // namespace docqa_cli
