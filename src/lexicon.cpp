#include "lexicon.hpp"
#include "constants.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace razdel {

namespace {

// Tokens conventionally followed by a period mid-sentence
const char* const DEFAULT_ABBREVIATIONS[] = {
    // Geography and addresses
    "г", "гг", "г-н", "г-жа",
    "ул", "пр", "пл", "пер", "просп", "наб",
    "д", "дом", "корп", "стр", "кв",
    "обл", "р-н", "п", "с", "дер", "пос",
    // Degrees and ranks
    "акад", "проф", "доц", "к", "канд", "докт",
    "м", "н", "мл", "ст",
    // Titles
    "им", "ген", "полк", "подп", "лейт", "кап",
    // Time and money
    "в", "вв", "р", "руб", "коп",
    "ч", "час", "мин", "сек",
    // General
    "т", "тт", "пп", "рис", "илл", "табл",
    "см", "ср", "напр", "в т.ч", "и т.д", "и т.п", "и др",
    "др", "проч", "прим", "примеч",
    // Units and numerals
    "кг", "мг", "ц", "л",
    "мм", "км", "га",
    "млн", "млрд", "тыс", "трлн",
    // Organizations and posts
    "о-во", "о-ва", "о-ние", "о-ния",
    "зам", "пом", "зав", "нач",
    // Latin
    "etc", "et al", "ibid", "op cit",
    // Languages
    "англ", "нем", "франц", "итал", "исп",
};

// Honorifics and posts that usually precede a full name
const char* const DEFAULT_TITLES[] = {
    "президент", "премьер", "министр", "губернатор", "мэр",
    "директор", "председатель", "генеральный", "академик",
    "профессор", "доктор", "господин", "госпожа", "товарищ",
};

// Verbs that usually introduce direct speech
const char* const DEFAULT_SPEECH_VERBS[] = {
    "сказал", "сказала", "сказали",
    "говорил", "говорила",
    "ответил", "ответила",
    "спросил", "спросила",
    "заявил", "заявила",
    "отметил", "отметила",
    "подчеркнул", "подчеркнула",
    "добавил", "добавила",
    "пояснил", "пояснила",
    "уточнил", "уточнила",
};

// Lower-cased, trimmed, without trailing periods
std::string abbreviation_key(std::string_view word) {
    std::string key = normalize_key(word);
    while (!key.empty() && key.back() == '.') {
        key.pop_back();
    }
    // Trim again in case the period followed a space
    return normalize_key(key);
}

} // namespace

Lexicon::Lexicon() {
    for (const char* word : DEFAULT_ABBREVIATIONS) abbreviations_.insert(word);
    for (const char* word : DEFAULT_TITLES) titles_.insert(word);
    for (const char* word : DEFAULT_SPEECH_VERBS) speech_verbs_.insert(word);
}

void Lexicon::add_abbreviation(std::string_view word) {
    std::string key = abbreviation_key(word);
    if (key.empty()) return;
    abbreviations_.insert(std::move(key));
}

bool Lexicon::load_abbreviations(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open abbreviation file: " << path << std::endl;
        return false;
    }

    size_t before = abbreviations_.size();
    std::string line;
    while (std::getline(file, line)) {
        // Trim
        line.erase(0, line.find_first_not_of(" \t\r\n"));
        line.erase(line.find_last_not_of(" \t\r\n") + 1);

        if (line.empty() || line[0] == '#') continue;
        add_abbreviation(line);
    }

    std::cout << "Loaded " << (abbreviations_.size() - before) << " abbreviations from "
              << path << ". Total: " << abbreviations_.size() << std::endl;
    return true;
}

bool Lexicon::contains_abbreviation(std::string_view word) const {
    return abbreviations_.count(abbreviation_key(word)) > 0;
}

bool Lexicon::is_title(std::string_view word) const {
    return titles_.count(normalize_key(word)) > 0;
}

bool Lexicon::is_speech_verb(std::string_view word) const {
    return speech_verbs_.count(normalize_key(word)) > 0;
}

std::vector<std::string> Lexicon::abbreviations() const {
    std::vector<std::string> sorted(abbreviations_.begin(), abbreviations_.end());
    std::sort(sorted.begin(), sorted.end(), [](const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return a.size() > b.size();
        return a < b;
    });
    return sorted;
}

} // namespace razdel
