#pragma once

#include <random>
#include <string>
#include <vector>

/**
 * @brief Made up but realistic looking values for the Fake* transformers.
 *
 * Emails and usernames carry a per-run counter so they never collide with each other, which keeps
 * unique constraints in the target database happy.
 */
class Fakes
{
  public:
    explicit Fakes(std::mt19937 &rng) : rng_(rng)
    {
    }

    std::string first_name();
    std::string last_name();
    std::string full_name();
    std::string email();
    std::string username();
    std::string company_name();
    std::string city();
    std::string street_address();
    std::string full_address();
    std::string post_code();
    std::string phone_number();
    std::string ipv4();
    std::string uuid();
    std::string base16_string(size_t length);
    std::string base32_string(size_t length);

  private:
    std::mt19937 &rng_;
    unsigned long unique_counter_ = 0;

    const std::string &pick(const std::vector<std::string> &options);
    char pick_char(const std::string &options);
    int random_int(int min, int max);
};
