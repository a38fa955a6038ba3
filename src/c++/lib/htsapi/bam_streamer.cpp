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

#include "htsapi/bam_streamer.hpp"

#include "blt_util/log.hpp"
#include "common/Exceptions.hpp"

#include <iostream>
#include <sstream>

stream_state_reporter::~stream_state_reporter() {}

bam_streamer::bam_streamer(const char* filename, const char* referenceFilename)
  : _is_record_set(false), _hfp(nullptr), _hdr(nullptr), _record_no(0), _stream_name(filename)
{
  using namespace asmqc::common;

  if ('\0' == *filename) {
    BOOST_THROW_EXCEPTION(GeneralException("Can't initialize bam_streamer with empty filename"));
  }

  _hfp = hts_open(filename, "rb");

  if (nullptr == _hfp) {
    std::ostringstream oss;
    oss << "Failed to open SAM/BAM/CRAM file for reading: '" << name() << "'";
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
  }

  if (nullptr != referenceFilename) {
    const std::string referenceFilenameIndex(std::string(referenceFilename) + ".fai");
    const int         ret = hts_set_fai_filename(_hfp, referenceFilenameIndex.c_str());
    if (ret != 0) {
      std::ostringstream oss;
      oss << "Failed to use reference: '" << referenceFilename << "' for BAM/CRAM file: '" << name() << "'";
      hts_close(_hfp);
      BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
    }
  }

  _hdr = sam_hdr_read(_hfp);

  if (nullptr == _hdr) {
    std::ostringstream oss;
    oss << "Failed to parse header from SAM/BAM/CRAM file: '" << name() << "'";
    hts_close(_hfp);
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
  }
}

bam_streamer::~bam_streamer()
{
  if (nullptr != _hdr) bam_hdr_destroy(_hdr);
  if (nullptr != _hfp) {
    const int retval = hts_close(_hfp);
    if (retval != 0) {
      log_os << "ERROR: Failed to close BAM/CRAM file: '" << name() << "'\n";
    }
  }
}

bool bam_streamer::next()
{
  if (nullptr == _hfp) return false;

  const int ret = sam_read1(_hfp, _hdr, _brec._bp);

  // Semi-documented sam_read1 API: -1 is expected read failure at end of stream, any other negative value
  // is an error
  if (ret < -1) {
    std::ostringstream oss;
    oss << "Unexpected return value from htslib sam_read1 function '" << ret
        << "' while attempting to read BAM/CRAM file:\n";
    report_state(oss);
    BOOST_THROW_EXCEPTION(asmqc::common::CorruptStreamException(oss.str()));
  }

  _is_record_set = (ret >= 0);
  if (_is_record_set) _record_no++;

  return _is_record_set;
}

const char* bam_streamer::target_id_to_name(const int32_t tid) const
{
  if (tid < 0) {
    static const char unmapped[] = "*";
    return unmapped;
  }
  return _hdr->target_name[tid];
}

void bam_streamer::report_state(std::ostream& os) const
{
  const bam_record* bamp(get_record_ptr());

  os << "\tbam_stream_label: '" << name() << "'\n";
  if (nullptr != bamp) {
    os << "\tbam_stream_record_no: " << record_no() << "\n";
    os << "\tbam_record QNAME/read_number: " << bamp->qname() << "/" << bamp->read_no() << "\n";
    const char* chrom_name(target_id_to_name(bamp->target_id()));
    os << "\tbam record RNAME: " << chrom_name << "\n";
    os << "\tbam record POS: " << bamp->pos() << "\n";
  } else {
    os << "\tno bam record currently set\n";
  }
}
