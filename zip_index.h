/* Parzip - Parallel zip archiver
   Copyright (C) 2026 The parzip developers.

   This program is free software: you can redistribute it and/or modify
   it under the terms of the GNU General Public License as published by
   the Free Software Foundation, either version 2 of the License, or
   (at your option) any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU General Public License for more details.

   You should have received a copy of the GNU General Public License
   along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

/* Read-only list of the entries of a zip archive, in central directory
   order, built from the end records and the central directory. */
class Zip_index
  {
  std::vector< Zip_header > entry_vector;
  std::string error_;
  const long long insize;
  int retval_;

  void set_errno_error( const char * const msg );
  void set_num_error( const char * const msg, unsigned long long num );
  bool find_end( const int infd, unsigned long long & cd_offset,
                 unsigned long long & cd_size,
                 unsigned long long & num_entries );
  bool parse_central_directory( const uint8_t * const buf,
                                const unsigned long long size,
                                const unsigned long long num_entries,
                                const unsigned long long cd_offset );

public:
  explicit Zip_index( const int infd );

  const std::string & error() const { return error_; }
  int retval() const { return retval_; }

  long entries() const { return entry_vector.size(); }
  const Zip_header & entry( const long i ) const { return entry_vector[i]; }
  };


struct z_stream_s;

/* Decompresses the data of one entry at a time with positional reads, so
   that several readers may share the same file descriptor. Each reader
   must be used by only one thread. */
class Zip_entry_reader
  {
  enum { ibuf_size = 16384 };
  const int infd;
  z_stream_s * zs;		// destructor frees it if needed
  Zip_header header;
  unsigned long long ipos;	// position of next compressed byte in archive
  unsigned long long crest;	// compressed bytes not yet read
  unsigned long long produced;	// uncompressed bytes returned
  uint32_t crc_;
  const char * e_msg_;		// message for show_file_error
  int e_code_;			// copy of errno
  bool open_;
  bool data_end;		// all the data of the entry decompressed
  bool at_end;			// size and crc verified
  uint8_t ibuf[ibuf_size];

  Zip_entry_reader( const Zip_entry_reader & );	// declared as private
  void operator=( const Zip_entry_reader & );	// declared as private

  int err( const int retval, const char * const msg = "", const int code = 0 )
    { e_msg_ = msg; e_code_ = code; open_ = false; return retval; }
  int check_end();

public:
  explicit Zip_entry_reader( const int fd );
  ~Zip_entry_reader();

  bool ok() const { return zs != 0; }

  /* Read the local header of h and prepare to decompress its data.
     Return 0 if OK, 1 on I/O error, 2 if the entry is corrupt or uses an
     unsupported method or encryption. If !OK, fills e_msg and e_code. */
  int open( const Zip_header & h );

  /* Read up to size uncompressed bytes into buf, setting rd to the number
     of bytes read. rd == 0 means end of entry, after the size and CRC have
     been verified. Return 0, 1 or 2 as open does. */
  int read( uint8_t * const buf, const int size, int & rd );

  const char * e_msg() const { return e_msg_; }
  int e_code() const { return e_code_; }
  };
