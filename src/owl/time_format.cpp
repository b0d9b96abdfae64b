#include "time_format.hpp"

#include <array>
#include <cctype>
#include <ctime>
#include <stdexcept>
#include <utility>

namespace {

// Each entry is {past, future}; "%s" is replaced by the count
using LocaleTable = std::array<std::pair<const char*, const char*>, 14>;

const LocaleTable EN_LOCALE = {{
    {"just now", "right now"},
    {"%s seconds ago", "in %s seconds"},
    {"1 minute ago", "in 1 minute"},
    {"%s minutes ago", "in %s minutes"},
    {"1 hour ago", "in 1 hour"},
    {"%s hours ago", "in %s hours"},
    {"1 day ago", "in 1 day"},
    {"%s days ago", "in %s days"},
    {"1 week ago", "in 1 week"},
    {"%s weeks ago", "in %s weeks"},
    {"1 month ago", "in 1 month"},
    {"%s months ago", "in %s months"},
    {"1 year ago", "in 1 year"},
    {"%s years ago", "in %s years"},
}};

const LocaleTable IT_LOCALE = {{
    {"poco fa", "fra poco"},
    {"%s secondi fa", "fra %s secondi"},
    {"un minuto fa", "fra un minuto"},
    {"%s minuti fa", "fra %s minuti"},
    {"un'ora fa", "fra un'ora"},
    {"%s ore fa", "fra %s ore"},
    {"un giorno fa", "fra un giorno"},
    {"%s giorni fa", "fra %s giorni"},
    {"una settimana fa", "fra una settimana"},
    {"%s settimane fa", "fra %s settimane"},
    {"un mese fa", "fra un mese"},
    {"%s mesi fa", "fra %s mesi"},
    {"un anno fa", "fra un anno"},
    {"%s anni fa", "fra %s anni"},
}};

const LocaleTable DE_LOCALE = {{
    {"gerade eben", "gleich"},
    {"vor %s Sekunden", "in %s Sekunden"},
    {"vor 1 Minute", "in 1 Minute"},
    {"vor %s Minuten", "in %s Minuten"},
    {"vor 1 Stunde", "in 1 Stunde"},
    {"vor %s Stunden", "in %s Stunden"},
    {"vor 1 Tag", "in 1 Tag"},
    {"vor %s Tagen", "in %s Tagen"},
    {"vor 1 Woche", "in 1 Woche"},
    {"vor %s Wochen", "in %s Wochen"},
    {"vor 1 Monat", "in 1 Monat"},
    {"vor %s Monaten", "in %s Monaten"},
    {"vor 1 Jahr", "in 1 Jahr"},
    {"vor %s Jahren", "in %s Jahren"},
}};

const LocaleTable FR_LOCALE = {{
    {"à l'instant", "dans un instant"},
    {"il y a %s secondes", "dans %s secondes"},
    {"il y a 1 minute", "dans 1 minute"},
    {"il y a %s minutes", "dans %s minutes"},
    {"il y a 1 heure", "dans 1 heure"},
    {"il y a %s heures", "dans %s heures"},
    {"il y a 1 jour", "dans 1 jour"},
    {"il y a %s jours", "dans %s jours"},
    {"il y a 1 semaine", "dans 1 semaine"},
    {"il y a %s semaines", "dans %s semaines"},
    {"il y a 1 mois", "dans 1 mois"},
    {"il y a %s mois", "dans %s mois"},
    {"il y a 1 an", "dans 1 an"},
    {"il y a %s ans", "dans %s ans"},
}};

const LocaleTable ES_LOCALE = {{
    {"justo ahora", "en un rato"},
    {"hace %s segundos", "en %s segundos"},
    {"hace 1 minuto", "en 1 minuto"},
    {"hace %s minutos", "en %s minutos"},
    {"hace 1 hora", "en 1 hora"},
    {"hace %s horas", "en %s horas"},
    {"hace 1 día", "en 1 día"},
    {"hace %s días", "en %s días"},
    {"hace 1 semana", "en 1 semana"},
    {"hace %s semanas", "en %s semanas"},
    {"hace 1 mes", "en 1 mes"},
    {"hace %s meses", "en %s meses"},
    {"hace 1 año", "en 1 año"},
    {"hace %s años", "en %s años"},
}};

// Seconds per minute, minutes per hour, hours per day, days per week,
// weeks per month, months per year
constexpr std::array<double, 6> UNIT_STEPS = {60.0, 60.0, 24.0, 7.0, 365.0 / 7.0 / 12.0, 12.0};

// Below this many seconds the result is "just now"
constexpr int64_t JUST_NOW_MAX_SECONDS = 9;

const LocaleTable* findLocale(const std::string& locale)
{
    std::string language;
    for (char c : locale)
    {
        if (c == '_' || c == '-' || c == '.')
        {
            break;
        }
        language += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (language.empty() || language == "en")
    {
        return &EN_LOCALE;
    }
    if (language == "it")
    {
        return &IT_LOCALE;
    }
    if (language == "de")
    {
        return &DE_LOCALE;
    }
    if (language == "fr")
    {
        return &FR_LOCALE;
    }
    if (language == "es")
    {
        return &ES_LOCALE;
    }
    return nullptr;
}

}  // namespace

bool TimeFormat::isSupportedLocale(const std::string& locale)
{
    return findLocale(locale) != nullptr;
}

std::string TimeFormat::timeAgo(int64_t then, int64_t now, const std::string& locale)
{
    const LocaleTable* table = findLocale(locale);
    if (table == nullptr)
    {
        throw std::invalid_argument("unsupported locale: " + locale);
    }

    bool future = then > now;
    double diff = future ? static_cast<double>(then - now) : static_cast<double>(now - then);

    size_t unit = 0;
    while (unit < UNIT_STEPS.size() && diff >= UNIT_STEPS[unit])
    {
        diff /= UNIT_STEPS[unit];
        ++unit;
    }
    int64_t count = static_cast<int64_t>(diff);

    size_t index = unit * 2;
    if (count > (index == 0 ? JUST_NOW_MAX_SECONDS : 1))
    {
        ++index;
    }

    const auto& entry = (*table)[index];
    std::string text = future ? entry.second : entry.first;
    size_t pos = text.find("%s");
    if (pos != std::string::npos)
    {
        text.replace(pos, 2, std::to_string(count));
    }
    return text;
}

std::string TimeFormat::isoLocal(int64_t epoch_seconds)
{
    time_t t = static_cast<time_t>(epoch_seconds);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return buf;
}
