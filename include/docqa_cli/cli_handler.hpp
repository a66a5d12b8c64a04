#pragma once

#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace docqa_cli
{

  enum class Command
  {
    Upload,
    Ask,
    Status,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string file_path;
    std::string question;
    std::string document_id;  // optional; pins a question to an uploaded document
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  // Non-200 reply from the server
  class HttpError : public CliError
  {
  public:
    HttpError(long status_code, const std::string &message)
        : CliError("HTTP " + std::to_string(status_code) + ": " + message), status_code_(status_code) {}

    long status_code() const
    {
      return status_code_;
    }

  private:
    long status_code_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Allow move constructor and assignment
    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command; returns false if the server reported a failure
    bool execute_command(const CliOptions &options);

    std::string get_api_base_url() const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    bool handle_upload_command(const CliOptions &options);
    bool handle_ask_command(const CliOptions &options);
    bool handle_status_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const std::string &body,
                                     const std::string &content_type);
    nlohmann::json perform_request(const std::string &url);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    static std::string read_file(const std::string &path);
    void print_answer_response(const nlohmann::json &response);
    void print_error(const std::string &error);
    static void print_help();
    std::string build_url(const std::string &endpoint);
  };

}
