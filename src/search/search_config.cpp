#include <regix/search/search_config.h>

#include <chrono>
#include <ctime>

namespace regix::search {

KeywordTables KeywordTables::defaults() {
    KeywordTables tables;
    tables.domainKeywords = {
        {"금융규제",
         {"isms", "isms-p", "인증", "인증기준", "점검항목", "보안인증", "규제", "준수",
          "컴플라이언스"}},
        {"클라우드", {"클라우드", "cloud", "aws", "azure", "gcp", "saas", "paas", "iaas"}},
        {"보안", {"보안", "security", "암호화", "encryption", "접근제어", "방화벽", "vpn"}},
        {"데이터보호", {"개인정보", "gdpr", "ccpa", "데이터보호", "프라이버시", "신용정보"}},
        {"기술", {"api", "devops", "ci/cd", "컨테이너", "쿠버네티스", "마이크로서비스"}},
    };

    tables.synonyms = {
        {"클라우드", {"cloud", "클라우드서비스", "클라우드컴퓨팅"}},
        {"보안", {"security", "보안정책", "정보보호", "데이터보호"}},
        {"규제", {"regulation", "규정", "준수", "법령", "기준", "컴플라이언스"}},
        {"인증", {"authentication", "인증서", "인증방식", "인가"}},
        {"암호화", {"encryption", "암호화방식", "복호화", "해시"}},
        {"API", {"application programming interface", "웹서비스"}},
        {"ISMS", {"정보보호관리체계", "정보보안관리체계", "보안인증"}},
    };
    return tables;
}

std::vector<std::string> SearchConfig::recentYears() const {
    int year = 0;
    if (recencyReferenceYear) {
        year = *recencyReferenceYear;
    } else {
        const std::time_t now =
            std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        localtime_r(&now, &tm);
        year = tm.tm_year + 1900;
    }

    std::vector<std::string> years;
    years.reserve(static_cast<size_t>(recencyWindowYears));
    for (int offset = recencyWindowYears - 1; offset >= 0; --offset) {
        years.push_back(std::to_string(year - offset));
    }
    return years;
}

} // namespace regix::search
