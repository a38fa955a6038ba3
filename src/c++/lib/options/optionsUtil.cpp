//
// AsmQC - Assembly Quality Control Engine
// Copyright (c) 2013-2019 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

#include "optionsUtil.hpp"

#include "boost/filesystem.hpp"

#include <cmath>
#include <sstream>

bool checkAndStandardizeRequiredInputFilePath(
    std::string& filename, const char* fileLabel, std::string& errorMsg)
{
  errorMsg.clear();

  if (filename.empty()) {
    std::ostringstream oss;
    oss << "Must specify " << fileLabel << " file";
    errorMsg = oss.str();
  } else if (!boost::filesystem::exists(filename)) {
    std::ostringstream oss;
    oss << "Can't find " << fileLabel << " file '" << filename << "'";
    errorMsg = oss.str();
  } else {
    filename = boost::filesystem::absolute(filename).string();
  }

  return (!errorMsg.empty());
}

bool checkAndStandardizeRequiredInputFilePaths(
    std::vector<std::string>& filenames, const char* fileLabel, std::string& errorMsg)
{
  errorMsg.clear();

  if (filenames.empty()) {
    std::ostringstream oss;
    oss << "Must specify at least one " << fileLabel << " file";
    errorMsg = oss.str();
    return true;
  }

  for (std::string& filename : filenames) {
    if (checkAndStandardizeRequiredInputFilePath(filename, fileLabel, errorMsg)) return true;
  }
  return false;
}

bool checkOutputPrefix(const std::string& prefix, const char* prefixLabel, std::string& errorMsg)
{
  errorMsg.clear();

  if (prefix.empty()) {
    std::ostringstream oss;
    oss << "Must specify " << prefixLabel;
    errorMsg = oss.str();
  } else {
    const boost::filesystem::path parent(boost::filesystem::absolute(prefix).parent_path());
    if (!boost::filesystem::is_directory(parent)) {
      std::ostringstream oss;
      oss << "Directory for " << prefixLabel << " does not exist: '" << parent.string() << "'";
      errorMsg = oss.str();
    }
  }

  return (!errorMsg.empty());
}

bool checkPositiveValue(const double value, const char* valueLabel, std::string& errorMsg)
{
  errorMsg.clear();

  if (!(std::isfinite(value) && (value > 0.))) {
    std::ostringstream oss;
    oss << "Invalid " << valueLabel << " '" << value << "', must be greater than zero";
    errorMsg = oss.str();
  }

  return (!errorMsg.empty());
}
