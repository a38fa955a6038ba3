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

/// \file
///

#include "report/JsonReport.hpp"

#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <iostream>

typedef rapidjson::Writer<rapidjson::StringBuffer> JsonWriter;

static void writeString(JsonWriter& writer, const std::string& str)
{
  writer.String(str.c_str(), static_cast<rapidjson::SizeType>(str.size()));
}

static void writeTableEntry(JsonWriter& writer, const char* header, const uint64_t value)
{
  writer.StartObject();
  writer.Key("header");
  writer.String(header);
  writer.Key("value");
  writer.Uint64(value);
  writer.Key("table");
  writer.String("assembly");
  writer.EndObject();
}

/// write track as [values, labels, boundaries]
static void writeTrack(JsonWriter& writer, const WindowTrack& track)
{
  writer.StartArray();

  writer.StartArray();
  for (const double value : track.values) {
    writer.Double(value);
  }
  writer.EndArray();

  writer.StartArray();
  for (const unsigned label : track.labels) {
    writer.Uint(label);
  }
  writer.EndArray();

  writer.StartArray();
  for (const TrackBoundary& boundary : track.boundaries) {
    writer.StartObject();
    writer.Key("nodeId");
    writer.Uint(boundary.nodeId);
    writer.Key("end");
    writer.Uint64(boundary.end);
    writer.EndObject();
  }
  writer.EndArray();

  writer.EndArray();
}

void writeAssemblyReportJson(
    const std::string&           sampleId,
    const AssemblySummary&       summary,
    const std::vector<unsigned>& sizeDistribution,
    const WindowTrack*           gcTrack,
    const WindowTrack*           coverageTrack,
    std::ostream&                os)
{
  rapidjson::StringBuffer buffer;
  JsonWriter              writer(buffer);

  writer.StartObject();

  writer.Key("tableRow");
  writer.StartArray();
  writer.StartObject();
  writer.Key("sample");
  writeString(writer, sampleId);
  writer.Key("data");
  writer.StartArray();
  writeTableEntry(writer, "Contigs", summary.contigCount);
  writeTableEntry(writer, "Assembled BP", summary.totalLength);
  writer.EndArray();
  writer.EndObject();
  writer.EndArray();

  writer.Key("plotData");
  writer.StartArray();
  writer.StartObject();
  writer.Key("sample");
  writeString(writer, sampleId);
  writer.Key("data");
  writer.StartObject();
  writer.Key("size_dist");
  writer.StartArray();
  for (const unsigned size : sizeDistribution) {
    writer.Uint(size);
  }
  writer.EndArray();
  if (gcTrack != nullptr) {
    writer.Key("gcSliding");
    writeTrack(writer, *gcTrack);
  }
  if (coverageTrack != nullptr) {
    writer.Key("covSliding");
    writeTrack(writer, *coverageTrack);
  }
  writer.EndObject();
  writer.EndObject();
  writer.EndArray();

  writer.EndObject();

  os << buffer.GetString();
}

void writeHealthReportJson(const std::string& processName, const HealthVerdict& verdict, std::ostream& os)
{
  rapidjson::StringBuffer buffer;
  JsonWriter              writer(buffer);

  writer.StartObject();

  writer.Key("warnings");
  writer.StartObject();
  writer.Key("process");
  writeString(writer, processName);
  writer.Key("value");
  writer.StartArray();
  for (const std::string& warning : verdict.warnings) {
    writeString(writer, warning);
  }
  writer.EndArray();
  writer.EndObject();

  writer.Key("fail");
  writer.StartObject();
  writer.Key("process");
  writeString(writer, processName);
  writer.Key("value");
  if (verdict.isFail) {
    writeString(writer, verdict.failReason);
  } else {
    writer.Null();
  }
  writer.EndObject();

  writer.EndObject();

  os << buffer.GetString();
}

void writeVersionsJson(const std::vector<ProgramVersion>& versions, std::ostream& os)
{
  rapidjson::StringBuffer buffer;
  JsonWriter              writer(buffer);

  writer.StartArray();
  for (const ProgramVersion& version : versions) {
    writer.StartObject();
    writer.Key("program");
    writeString(writer, version.program);
    writer.Key("version");
    writeString(writer, version.version);
    writer.Key("build");
    writeString(writer, version.build);
    writer.EndObject();
  }
  writer.EndArray();

  os << buffer.GetString();
}

void writeHealthWarnings(const HealthVerdict& verdict, std::ostream& os)
{
  for (const std::string& message : verdict.messages) {
    os << message << "\n";
  }
}
