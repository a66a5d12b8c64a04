#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "docqa_api/routes.hpp"
#include "docqa_api/server.hpp"
#include "docqa_cli/cli_handler.hpp"
#include "docqa_core/services/question_answering_service.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace docqa_cli {

class CliHandlerParseTest : public ::testing::Test {
 protected:
  CliOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "docqa_cli");
    storage_ = std::move(args);
    argv_.clear();
    for (auto &arg : storage_) {
      argv_.push_back(arg.data());
    }
    return CliHandler::parse_arguments(static_cast<int>(argv_.size()), argv_.data());
  }

  std::vector<std::string> storage_;
  std::vector<char *> argv_;
};

TEST_F(CliHandlerParseTest, NoArgumentsShowsHelp) {
  EXPECT_EQ(parse({}).command, Command::Help);
}

TEST_F(CliHandlerParseTest, UploadTakesFile) {
  CliOptions options = parse({"upload", "--file", "notes.txt"});
  EXPECT_EQ(options.command, Command::Upload);
  EXPECT_EQ(options.file_path, "notes.txt");
}

TEST_F(CliHandlerParseTest, UploadWithoutFileThrows) {
  EXPECT_THROW(parse({"upload"}), CliError);
}

TEST_F(CliHandlerParseTest, AskTakesQuestionAndOptionalDocument) {
  CliOptions options = parse({"ask", "-q", "Who wrote it?", "-d", "abc123"});
  EXPECT_EQ(options.command, Command::Ask);
  EXPECT_EQ(options.question, "Who wrote it?");
  EXPECT_EQ(options.document_id, "abc123");
}

TEST_F(CliHandlerParseTest, AskWithoutQuestionThrows) {
  EXPECT_THROW(parse({"ask", "--document", "abc"}), CliError);
}

TEST_F(CliHandlerParseTest, UnknownCommandThrows) {
  EXPECT_THROW(parse({"search", "--query", "x"}), CliError);
}

TEST_F(CliHandlerParseTest, StatusShortcut) {
  EXPECT_EQ(parse({"s"}).command, Command::Status);
}

TEST(HttpErrorTest, CarriesStatusCode) {
  HttpError error(404, "No document loaded");
  EXPECT_EQ(error.status_code(), 404);
  EXPECT_EQ(std::string(error.what()), "HTTP 404: No document loaded");
}

// Runs the commands against a live API server on a loopback port
class CliHandlerServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    using ::testing::_;
    // ctest runs each test in its own process, possibly in parallel, so each
    // test gets its own port
    std::string test_name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
    int port = 18000;
    int name_sum = 0;
    for (char c : test_name) {
      name_sum += static_cast<unsigned char>(c);
    }
    port += name_sum % 1000;
    address_ = "127.0.0.1:" + std::to_string(port);
    base_url_ = "http://" + address_;

    embedder_ = std::make_shared<::testing::NiceMock<docqa_tests::MockEmbedder>>();
    answer_service_ = std::make_shared<::testing::NiceMock<docqa_tests::MockAnswerService>>();
    ON_CALL(*embedder_, embed(_))
        .WillByDefault(::testing::Invoke([](const std::vector<std::string> &texts) {
          return std::vector<std::vector<float>>(texts.size(), std::vector<float>{1.0f, 0.0f});
        }));
    ON_CALL(*answer_service_, complete(_, _, _)).WillByDefault(::testing::Return("Forty-two."));

    auto qa_service = std::make_shared<docqa_core::QuestionAnsweringService>(
        embedder_, answer_service_, docqa_core::QaOptions{});
    server_ = std::make_unique<docqa_api::Server>(address_);
    routes_ = std::make_unique<docqa_api::Routes>(qa_service);
    routes_->register_routes(*server_);
    server_->start();
    ASSERT_TRUE(wait_until_listening());
  }

  void TearDown() override {
    server_->stop();
    if (!temp_file_.empty()) {
      std::filesystem::remove(temp_file_);
    }
  }

  static size_t discard_body(char *, size_t size, size_t nmemb, void *) {
    return size * nmemb;
  }

  bool wait_until_listening() const {
    CURL *curl = curl_easy_init();
    if (!curl) {
      return false;
    }
    std::string url = base_url_ + "/";
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_body);
    bool listening = false;
    for (int attempt = 0; attempt < 50 && !listening; ++attempt) {
      listening = curl_easy_perform(curl) == CURLE_OK;
      if (!listening) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    }
    curl_easy_cleanup(curl);
    return listening;
  }

  std::shared_ptr<::testing::NiceMock<docqa_tests::MockEmbedder>> embedder_;
  std::shared_ptr<::testing::NiceMock<docqa_tests::MockAnswerService>> answer_service_;
  std::unique_ptr<docqa_api::Server> server_;
  std::unique_ptr<docqa_api::Routes> routes_;
  std::filesystem::path temp_file_;
  std::string address_;
  std::string base_url_;
};

TEST_F(CliHandlerServerTest, StatusWithoutDocumentSucceeds) {
  CliHandler handler(base_url_);
  CliOptions options;
  options.command = Command::Status;
  EXPECT_TRUE(handler.execute_command(options));
}

TEST_F(CliHandlerServerTest, UploadThenAskSucceeds) {
  temp_file_ = docqa_tests::TestUtilities::create_temp_file("The answer is forty-two.");
  CliHandler handler(base_url_);

  CliOptions upload;
  upload.command = Command::Upload;
  upload.file_path = temp_file_.string();
  ASSERT_TRUE(handler.execute_command(upload));

  CliOptions status;
  status.command = Command::Status;
  EXPECT_TRUE(handler.execute_command(status));

  CliOptions ask;
  ask.command = Command::Ask;
  ask.question = "What is the answer?";
  EXPECT_TRUE(handler.execute_command(ask));
}

TEST_F(CliHandlerServerTest, AskWithoutDocumentFails) {
  CliHandler handler(base_url_);
  CliOptions ask;
  ask.command = Command::Ask;
  ask.question = "What is the answer?";
  EXPECT_FALSE(handler.execute_command(ask));
}

}  // namespace docqa_cli
