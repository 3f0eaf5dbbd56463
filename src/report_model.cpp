#include "core/report_model.hpp"

const std::string *ReportContentModel::findField(const std::string &section, const std::string &field) const
{
    auto section_it = sections.find(section);
    if (section_it == sections.end())
    {
        return nullptr;
    }
    auto field_it = section_it->second.find(field);
    if (field_it == section_it->second.end())
    {
        return nullptr;
    }
    return &field_it->second;
}

const std::vector<ReportSectionSpec> &ReportSchema::sections()
{
    static const std::vector<ReportSectionSpec> schema = {
        {"projectInformation",
         "ASSIGNMENT",
         {{"fileNumber", "File Number"},
          {"dateOfCreation", "Date of Creation"},
          {"insuredName", "Insured"},
          {"insuredAddress", "Property Address"},
          {"dateOfLoss", "Date of Loss"},
          {"claimNumber", "Claim Number"},
          {"clientCompany", "Client"},
          {"clientContact", "Client Contact"},
          {"engineerName", "Engineer"},
          {"technicalReviewer", "Technical Reviewer"},
          {"siteVisitDate", "Site Visit Date"}}},
        {"assignmentScope",
         "METHODOLOGY",
         {{"intervieweesNames", "Interviewees"},
          {"providedDocumentsTitles", "Documents Reviewed"},
          {"additionalMethodologyNotes", "Additional Methodology Notes"}}},
        {"buildingObservations",
         "SITE OBSERVATIONS",
         {{"buildingSystemDescription", "Building System Description"},
          {"exteriorObservations", "Exterior Observations"},
          {"interiorObservations", "Interior Observations"},
          {"otherSiteObservations", "Other Site Observations"}}},
        {"research",
         "RESEARCH",
         {{"weatherDataSummary", "Weather Data Summary"},
          {"corelogicHailSummary", "CoreLogic Hail Summary"},
          {"corelogicWindSummary", "CoreLogic Wind Summary"}}},
        {"discussionAnalysis",
         "DISCUSSION & ANALYSIS",
         {{"siteDiscussionAnalysis", "Site Discussion & Analysis"},
          {"weatherDiscussionAnalysis", "Weather Discussion & Analysis"},
          {"weatherImpactAnalysis", "Weather Impact Analysis"},
          {"recommendationsAndDiscussion", "Recommendations & Discussion"}}},
        {"conclusions",
         "CONCLUSIONS",
         {{"conclusions", "Conclusions"}}}};
    return schema;
}

std::string ReportSchema::canonicalSectionId(const std::string &id)
{
    if (id == "buildingAndSite")
        return "buildingObservations";
    if (id == "discussionAndAnalysis")
        return "discussionAnalysis";
    return id;
}
