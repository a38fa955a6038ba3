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

#pragma once

#include "htsapi/bam_record.hpp"

#include "boost/utility.hpp"

#include <iosfwd>
#include <string>

/// Interface for any object which provides current record and file position for error reporting purposes
struct stream_state_reporter {
  virtual void report_state(std::ostream& /*os*/) const {}

  virtual ~stream_state_reporter();
};

/// Stream all bam records from a CRAM/BAM/SAM file in file order
///
//
// Example use:
// bam_streamer stream("sample1.bam", nullptr);
// while (stream.next()) {
//     const bam_record& read(*(stream.get_record_ptr()));
//     if(read.is_unmapped()) unmappedCount++;
// }
//
struct bam_streamer : public stream_state_reporter, public boost::noncopyable {
  /// \param filename CRAM/BAM/SAM input file
  ///
  /// \param referenceFilename Corresponding reference file. nullptr can be given here to indicate that the
  /// reference is not being provided, but many CRAM files cannot be read in this case.
  bam_streamer(const char* filename, const char* referenceFilename);

  ~bam_streamer() override;

  bool next();

  const bam_record* get_record_ptr() const
  {
    if (_is_record_set)
      return &_brec;
    else
      return nullptr;
  }

  const char* name() const { return _stream_name.c_str(); }

  unsigned record_no() const { return _record_no; }

  void report_state(std::ostream& os) const override;

  const char* target_id_to_name(const int32_t tid) const;

  const bam_hdr_t& get_header() const { return *(_hdr); }

private:
  bool       _is_record_set;
  htsFile*   _hfp;
  bam_hdr_t* _hdr;
  bam_record _brec;

  // track for debug only:
  unsigned    _record_no;
  std::string _stream_name;
};
