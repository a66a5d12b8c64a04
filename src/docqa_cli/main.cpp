#include "docqa_cli/cli_handler.hpp"
#include <iostream>
#include <cstdlib>

int main(int argc, char *argv[])
{
  try
  {
    // Get API base URL from environment variable
    const char *api_base_url = std::getenv("API_BASE_URL");
    std::string base_url = api_base_url ? api_base_url : "http://127.0.0.1:3030";

    docqa_cli::CliOptions options = docqa_cli::CliHandler::parse_arguments(argc, argv);

    docqa_cli::CliHandler handler(base_url);
    if (!handler.execute_command(options))
    {
      return 1;
    }
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
