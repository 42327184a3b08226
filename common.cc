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

#define _FILE_OFFSET_BITS 64

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

#include "parzip.h"

#ifndef O_BINARY
#define O_BINARY 0
#endif


int verbosity = 0;
const char * const program_name = "parzip";


/* Return the number of bytes really read.
   If (value returned < size) and (errno == 0), means EOF was reached.
*/
long readblock( const int fd, uint8_t * const buf, const long size )
  {
  long sz = 0;
  errno = 0;
  while( sz < size )
    {
    const long n = read( fd, buf + sz, size - sz );
    if( n > 0 ) sz += n;
    else if( n == 0 ) break;				// EOF
    else if( errno != EINTR ) break;
    errno = 0;
    }
  return sz;
  }


/* Return the number of bytes really written.
   If (value returned < size), it is always an error.
*/
int writeblock( const int fd, const uint8_t * const buf, const int size )
  {
  int sz = 0;
  errno = 0;
  while( sz < size )
    {
    const int n = write( fd, buf + sz, size - sz );
    if( n > 0 ) sz += n;
    else if( n < 0 && errno != EINTR ) break;
    errno = 0;
    }
  return sz;
  }


/* Return the number of bytes really read at position pos.
   If (value returned < size) and (errno == 0), means EOF was reached.
   Does not move the file offset, so it can be shared among threads.
*/
int preadblock( const int fd, uint8_t * const buf, const int size,
                const long long pos )
  {
  int sz = 0;
  errno = 0;
  while( sz < size )
    {
    const int n = pread( fd, buf + sz, size - sz, pos + sz );
    if( n > 0 ) sz += n;
    else if( n == 0 ) break;				// EOF
    else if( errno != EINTR ) break;
    errno = 0;
    }
  return sz;
  }


const char * format_num3( unsigned long long num, const bool negative )
  {
  enum { buffers = 8, bufsize = 4 * sizeof num };
  static char buffer[buffers][bufsize];	// circle of buffers for printf
  static int current = 0;

  char * const buf = buffer[current++]; current %= buffers;
  char * p = buf + bufsize - 1;		// fill the buffer backwards
  *p = 0;				// terminator
  const bool split = num >= 10000;

  for( int i = 0; ; )
    {
    *(--p) = num % 10 + '0'; num /= 10; if( num == 0 ) break;
    if( split && ++i >= 3 ) { i = 0; *(--p) = '_'; }
    }
  if( negative ) *(--p) = '-';
  return p;
  }


/* Open name for reading. If estrp is not null, append the error message
   to *estrp instead of printing it. */
int open_instream( const char * const name, std::string * const estrp )
  {
  const int infd = open( name, O_RDONLY | O_BINARY );
  if( infd < 0 )
    {
    if( estrp ) format_file_error( *estrp, name, rd_open_msg, errno );
    else show_file_error( name, rd_open_msg, errno );
    return -1;
    }
  struct stat st;
  if( fstat( infd, &st ) == 0 && S_ISDIR( st.st_mode ) )
    {
    const char * const msg = "Can't read. Is a directory.";
    if( estrp ) format_file_error( *estrp, name, msg );
    else show_file_error( name, msg );
    close( infd ); return -1;		// infd must not be a directory
    }
  return infd;
  }


// Create or truncate name for writing.
int open_outstream( const std::string & name, std::string * const estrp )
  {
  const int flags = O_CREAT | O_WRONLY | O_TRUNC | O_BINARY;
  const mode_t outfd_mode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;

  const int outfd = open( name.c_str(), flags, outfd_mode );
  if( outfd < 0 )
    {
    const char * const msg = "Can't create file";
    if( estrp ) format_file_error( *estrp, name.c_str(), msg, errno );
    else show_file_error( name.c_str(), msg, errno );
    }
  return outfd;
  }


void show_error( const char * const msg, const int errcode, const bool help )
  {
  if( verbosity < 0 ) return;
  if( msg && msg[0] )
    std::fprintf( stderr, "%s: %s%s%s\n", program_name, msg,
                  ( errcode > 0 ) ? ": " : "",
                  ( errcode > 0 ) ? std::strerror( errcode ) : "" );
  if( help )
    std::fprintf( stderr, "Try '%s --help' for more information.\n",
                  program_name );
  }


void print_error( const int errcode, const char * const format, ... )
  {
  if( verbosity < 0 ) return;
  va_list args;
  std::fprintf( stderr, "%s: ", program_name );
  va_start( args, format );
  std::vfprintf( stderr, format, args );
  va_end( args );
  if( errcode <= 0 ) std::fputc( '\n', stderr );
  else std::fprintf( stderr, ": %s\n", std::strerror( errcode ) );
  }


void format_file_error( std::string & estr, const char * const filename,
                        const char * const msg, const int errcode )
  {
  if( verbosity < 0 ) return;
  estr += program_name; estr += ": "; estr += filename; estr += ": ";
  estr += msg;
  if( errcode > 0 ) { estr += ": "; estr += std::strerror( errcode ); }
  estr += '\n';
  }


void show_file_error( const char * const filename, const char * const msg,
                      const int errcode )
  {
  if( verbosity >= 0 && msg && msg[0] )
    std::fprintf( stderr, "%s: %s: %s%s%s\n", program_name,
                  filename, msg, ( errcode > 0 ) ? ": " : "",
                  ( errcode > 0 ) ? std::strerror( errcode ) : "" );
  }


void internal_error( const char * const msg )
  {
  if( verbosity >= 0 )
    std::fprintf( stderr, "%s: internal error: %s\n", program_name, msg );
  std::exit( 3 );
  }
