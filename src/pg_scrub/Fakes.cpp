#include "pg_scrub/Fakes.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace
{
const std::vector<std::string> FIRST_NAMES = {
    "Alberta", "Bertram", "Claudia", "Cordia", "Creola",  "Durward", "Eula",   "Harmon", "Hanna", "Laurie",
    "Maye",    "Reba",    "Seth",    "Vida",   "Agatha",  "Ezra",    "Imogen", "Jasper", "Nell",  "Rufus",
    "Tamsin",  "Wilbur",  "Odette",  "Percy",  "Winifred"};

const std::vector<std::string> LAST_NAMES = {
    "Beatty", "Brown",   "Hintz",    "Kris",   "Schneider", "Shanahan", "Walter", "Abbott", "Carver", "Dunmore",
    "Ellery", "Fairley", "Gaskell",  "Holt",   "Ingram",    "Jessop",   "Kemble", "Lowry",  "Marsh",  "Norcott",
    "Oakley", "Pennock", "Quartley", "Ridley", "Stanton"};

const std::vector<std::string> EMAIL_WORDS = {"quo",   "nam",    "voluptatem", "quis", "perferendis", "non",
                                              "ipsam", "dolore", "minima",     "sunt", "velit",       "aut"};

const std::vector<std::string> EMAIL_DOMAINS = {"gmail.com", "hotmail.com", "yahoo.com", "example.com"};

const std::vector<std::string> COMPANY_SUFFIXES = {"Ltd", "Group", "and Sons", "Holdings", "LLC", "Partners"};

const std::vector<std::string> CITIES = {"Aldbourne", "Brackley", "Cirencester", "Dunstable", "Evesham",
                                         "Frome",     "Glossop",  "Hexham",      "Ilkley",    "Kendal",
                                         "Ludlow",    "Malton",   "Northwich",   "Oakham",    "Penrith"};

const std::vector<std::string> STREET_NAMES = {"Acacia", "Beech",   "Chapel", "Church", "Hawthorn", "High",
                                               "Mill",   "Orchard", "Park",   "School", "Station",  "Victoria"};

const std::vector<std::string> STREET_SUFFIXES = {"Road", "Street", "Lane", "Avenue", "Close", "Way"};

const std::string UPPER_LETTERS = "ABCDEFGHJKLMNPRSTUWY";
const std::string HEX_DIGITS = "0123456789abcdef";
const std::string BASE32_ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

std::string to_lower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
    return str;
}
} // namespace

const std::string &Fakes::pick(const std::vector<std::string> &options)
{
    std::uniform_int_distribution<size_t> dist(0, options.size() - 1);
    return options[dist(rng_)];
}

char Fakes::pick_char(const std::string &options)
{
    std::uniform_int_distribution<size_t> dist(0, options.size() - 1);
    return options[dist(rng_)];
}

int Fakes::random_int(int min, int max)
{
    std::uniform_int_distribution<int> dist(min, max);
    return dist(rng_);
}

std::string Fakes::first_name()
{
    return pick(FIRST_NAMES);
}

std::string Fakes::last_name()
{
    return pick(LAST_NAMES);
}

std::string Fakes::full_name()
{
    return first_name() + " " + last_name();
}

std::string Fakes::email()
{
    return std::to_string(++unique_counter_) + "-" + to_lower(first_name()) + "_" + pick(EMAIL_WORDS) + "@" +
           pick(EMAIL_DOMAINS);
}

std::string Fakes::username()
{
    return to_lower(first_name()) + "_" + to_lower(last_name()) + std::to_string(++unique_counter_);
}

std::string Fakes::company_name()
{
    return last_name() + " " + pick(COMPANY_SUFFIXES);
}

std::string Fakes::city()
{
    return pick(CITIES);
}

std::string Fakes::street_address()
{
    return std::to_string(random_int(1, 250)) + " " + pick(STREET_NAMES) + " " + pick(STREET_SUFFIXES);
}

std::string Fakes::full_address()
{
    return street_address() + ", " + city() + ", " + post_code();
}

std::string Fakes::post_code()
{
    std::string code;
    code += pick_char(UPPER_LETTERS);
    code += pick_char(UPPER_LETTERS);
    code += std::to_string(random_int(1, 29));
    code += " ";
    code += std::to_string(random_int(0, 9));
    code += pick_char(UPPER_LETTERS);
    code += pick_char(UPPER_LETTERS);
    return code;
}

// Ofcom reserves 07700 900000 to 07700 900999 for drama, so these never reach a real person.
std::string Fakes::phone_number()
{
    char digits[4];
    std::snprintf(digits, sizeof(digits), "%03d", random_int(0, 999));
    return std::string("+447700900") + digits;
}

std::string Fakes::ipv4()
{
    return std::to_string(random_int(1, 254)) + "." + std::to_string(random_int(0, 255)) + "." +
           std::to_string(random_int(0, 255)) + "." + std::to_string(random_int(1, 254));
}

std::string Fakes::uuid()
{
    std::string id = base16_string(32);
    id[12] = '4';
    id[16] = HEX_DIGITS[8 + random_int(0, 3)];
    return id.substr(0, 8) + "-" + id.substr(8, 4) + "-" + id.substr(12, 4) + "-" + id.substr(16, 4) + "-" +
           id.substr(20);
}

std::string Fakes::base16_string(size_t length)
{
    std::string result;
    for (size_t i = 0; i < length; ++i)
        result += pick_char(HEX_DIGITS);
    return result;
}

std::string Fakes::base32_string(size_t length)
{
    std::string result;
    for (size_t i = 0; i < length; ++i)
        result += pick_char(BASE32_ALPHABET);
    return result;
}
