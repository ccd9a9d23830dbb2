#include "commands/ResumeDump.hpp"
#include "commands/validate.hpp"
#include "resume/Models.hpp"

#include <iostream>
#include <optional>
#include <vector>

static void printList(const char* label, const std::vector<std::string>& items) {
    std::cout << "    " << label << ": ";
    for (size_t i = 0; i < items.size(); ++i) {
        std::cout << items[i];
        if (i + 1 < items.size()) std::cout << ", ";
    }
    std::cout << "\n";
}

static void printSection(const char* title, const std::optional<std::vector<std::string>>& items) {
    if (!items || items->empty()) return;
    std::cout << "[" << title << "]\n";
    for (const auto& s : *items) std::cout << "  - " << s << "\n";
    std::cout << "\n";
}

static std::string datesOf(const std::optional<resumeval::DateRange>& d) {
    if (!d) return "ongoing";
    return d->start + " - " + d->end;
}

int resumeDump(const std::string& resumePath) {
    const resumeval::ValidationResult res = validate_input(resumePath, resumeval::ValidatorConfig{});
    if (!res.ok()) {
        std::cerr << "[error] failed to load resume: " << res.report.error_count() << " error(s)\n";
        print_violations(std::cerr, res.report);
        return exit_code_for(res.report);
    }
    if (res.report.warning_count() > 0) {
        std::cerr << "[warn] " << res.report.warning_count() << " warning(s)\n";
        print_violations(std::cerr, res.report);
    }

    const resumeval::Resume& r = *res.resume;
    const resumeval::ContactInformation& c = r.contact_information;

    std::cout << "[Contact] " << c.first_name << " " << c.last_name << " <" << c.email << ">\n";
    if (c.phone) std::cout << "    phone: " << *c.phone << "\n";
    if (c.city || c.country) {
        std::cout << "    location: " << c.city.value_or("") << (c.city && c.country ? ", " : "")
                  << c.country.value_or("") << "\n";
    }
    std::cout << "\n";

    for (const auto& w : r.work_history) {
        std::cout << "[Experience] " << w.position_or_title << " - " << w.company_name
                  << " (" << w.location_or_remote << ", " << datesOf(w.duration) << ")\n";
        for (const auto& line : w.responsibilities_accomplishments) {
            std::cout << "  - " << line << "\n";
        }
        std::cout << "\n";
    }

    for (const auto& e : r.education_history) {
        std::cout << "[Education] " << e.degree << " - " << e.institution
                  << " (" << datesOf(e.duration) << ")\n";
        if (e.majors && !e.majors->empty()) printList("majors", *e.majors);
        if (e.minors && !e.minors->empty()) printList("minors", *e.minors);
        if (e.grade_point_average) std::cout << "    gpa: " << *e.grade_point_average << "\n";
        std::cout << "\n";
    }

    printSection("Skills", r.skills);
    printSection("Certifications", r.certifications);
    printSection("Publications", r.publications);
    printSection("Patents", r.patents);
    printSection("Websites", r.websites);

    return 0;
}
