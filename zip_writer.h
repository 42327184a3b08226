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

// Receives the uncompressed data of one entry.
class Data_sink
  {
public:
  virtual bool write( const uint8_t * const buf, const int size ) = 0;
  virtual ~Data_sink() {}
  };


/* Produces the data of one entry when the entry is committed.
   write_to returns 0 if OK, or 1 with a message in estr. If the sink
   fails, write_to stops and returns 1 without a message. */
class Content_source
  {
public:
  virtual int write_to( Data_sink & sink, std::string & estr ) const = 0;
  virtual ~Content_source() {}
  };


class Deflate_sink;

/* Appends entries to a zip archive open in outfd. Entries are written in
   the order of the calls to write_entry. finish writes the central
   directory and the end records; without it the archive is invalid. */
class Zip_writer
  {
  const int outfd;
  const std::string archive_name;
  const int level;			// 0 .. 9
  unsigned long long pos;		// bytes written to outfd
  std::vector< Zip_header > header_vector;
  int write_errno;
  bool write_error_;
  bool finished;

  Zip_writer( const Zip_writer & );		// declared as private
  void operator=( const Zip_writer & );		// declared as private

  bool write_data( const uint8_t * const buf, const unsigned long size );
  int write_fail( std::string & estr );
  friend class Deflate_sink;

public:
  Zip_writer( const int fd, const std::string & name, const int lev )
    : outfd( fd ), archive_name( name ), level( lev ), pos( 0 ),
      write_errno( 0 ), write_error_( false ), finished( false ) {}

  /* Write the local header and, if content is not null, the compressed
     data and the data descriptor. Return 0 if OK, 1 if the archive or
     the content can't be written, with a message in estr. */
  int write_entry( const Zip_header & header, const Content_source * const content,
                   std::string & estr );
  int finish( std::string & estr );

  bool write_error() const { return write_error_; }
  long entries() const { return header_vector.size(); }
  const Zip_header & entry( const long i ) const { return header_vector[i]; }
  };
