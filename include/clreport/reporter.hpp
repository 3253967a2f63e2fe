#ifndef CLREPORT_REPORTER_HPP
#define CLREPORT_REPORTER_HPP

#include <iosfwd>
#include <string>
#include <vector>

#include <clreport/environment.hpp>


namespace clreport
{

std::vector<std::string>
listPlatformSummaries(const ComputeEnvironment& environment, std::ostream& os);


// Enumeration failures propagate; lines already written are left as is.
void
printFullReport(const ComputeEnvironment& environment, std::ostream& os);

}  // namespace clreport

#endif  // CLREPORT_REPORTER_HPP
