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

#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>

#include "parzip.h"
#include "common_mutex.h"
#include "zip_format.h"
#include "zip_index.h"
#include "zip_writer.h"
#include "create.h"
#include "decode.h"
#include "test_util.h"

namespace {

class String_source : public Content_source
  {
  const std::string data;

public:
  explicit String_source( const std::string & d ) : data( d ) {}

  int write_to( Data_sink & sink, std::string & ) const
    { return sink.write( (const uint8_t *)data.data(), data.size() ) ? 0 : 1; }
  };

typedef std::vector< std::pair< std::string, std::string > > Entry_list;

// write entries in order. Names ending in '/' are directories.
bool write_zip( const std::string & archive, const Entry_list & entries )
  {
  const int fd = open_outstream( archive );
  if( fd < 0 ) return false;
  Zip_writer writer( fd, archive, 6 );
  std::string estr;
  for( unsigned i = 0; i < entries.size(); ++i )
    {
    Zip_header h;
    h.name = entries[i].first;
    h.mtime = 1600000000;
    const bool isdir = h.name[h.name.size()-1] == '/';
    h.mode = isdir ? ( S_IFDIR | 0755 ) : ( S_IFREG | 0644 );
    const String_source content( entries[i].second );
    if( writer.write_entry( h, isdir ? 0 : &content, estr ) != 0 )
      { close( fd ); return false; }
    }
  const bool ok = writer.finish( estr ) == 0;
  return close( fd ) == 0 && ok;
  }


// Counts the destination files open at the same time.
class Counting_fs : public Dest_fs
  {
  pthread_mutex_t mutex;
  int open_files;

public:
  int max_open_files;
  int files_created;

  Counting_fs() : open_files( 0 ), max_open_files( 0 ), files_created( 0 )
    { xinit_mutex( &mutex ); }
  ~Counting_fs() { xdestroy_mutex( &mutex ); }

  int create_file( const std::string & filename, const mode_t mode )
    {
    const int fd = Dest_fs::create_file( filename, mode );
    if( fd < 0 ) return fd;
    xlock( &mutex );
    ++files_created;
    if( ++open_files > max_open_files ) max_open_files = open_files;
    xunlock( &mutex );
    usleep( 2000 );			// keep the file open for a while
    return fd;
    }

  int close_file( const int fd )
    {
    xlock( &mutex ); --open_files; xunlock( &mutex );
    return Dest_fs::close_file( fd );
    }
  };


// Fails to create any file named "bad".
class Failing_fs : public Dest_fs
  {
public:
  int create_file( const std::string & filename, const mode_t mode )
    {
    if( base_name( filename ) == "bad" ) { errno = EIO; return -1; }
    return Dest_fs::create_file( filename, mode );
    }
  };


class UnpackTest : public ::testing::Test
  {
protected:
  test_util::Temp_dir tmp;
  std::string archive, dest;

  void SetUp()
    {
    ASSERT_TRUE( tmp.ok() );
    archive = tmp( "in.zip" );
    dest = tmp( "out/dest" );
    }

  Unpack_options options( const int workers, const int permits )
    {
    Unpack_options opts;
    opts.archive = archive;
    opts.dest = dest;
    opts.num_workers = workers;
    opts.num_permits = permits;
    opts.preserve_permissions = true;
    return opts;
    }
  };

} // end namespace


TEST_F( UnpackTest, RoundTripRestoresNamesContentsAndModes )
  {
  const std::string src = tmp( "src" );
  ASSERT_TRUE( test_util::write_file( src + "/a/x", test_util::make_data( 1, 100000 ), 0640 ) );
  ASSERT_TRUE( test_util::write_file( src + "/a/sub/run", "#!/bin/sh\n", 0755 ) );
  ASSERT_TRUE( test_util::write_file( src + "/secret", "s", 0600 ) );
  ASSERT_TRUE( test_util::write_file( src + "/empty", "", 0644 ) );
  ASSERT_TRUE( make_dir_path( src + "/void" ) );
  Pack_options popts;
  popts.source = src;
  popts.archive = archive;
  popts.num_workers = 4;
  popts.mtime = 1600000000;
  popts.mtime_set = true;
  const Op_error perror = pack_archive( popts );
  ASSERT_TRUE( perror.ok() ) << perror.msg;

  const Op_error error = unpack_archive( options( 4, 2 ) );
  ASSERT_TRUE( error.ok() ) << error.msg;
  const char * const files[] = { "a/x", "a/sub/run", "secret", "empty" };
  for( unsigned i = 0; i < 4; ++i )
    {
    const std::string name( files[i] );
    EXPECT_EQ( test_util::read_file( src + '/' + name ),
               test_util::read_file( dest + "/src/" + name ) ) << name;
    EXPECT_EQ( test_util::file_perm( src + '/' + name ),
               test_util::file_perm( dest + "/src/" + name ) ) << name;
    struct stat st;
    ASSERT_EQ( 0, stat( ( dest + "/src/" + name ).c_str(), &st ) );
    EXPECT_EQ( 1600000000, (long long)st.st_mtime ) << name;
    }
  EXPECT_TRUE( test_util::is_dir( dest + "/src/void" ) );
  EXPECT_TRUE( test_util::is_dir( dest + "/src/a/sub" ) );
  }


TEST_F( UnpackTest, ZipSlipIsRejected )
  {
  Entry_list entries;
  entries.push_back( std::make_pair( "ok.txt", "fine" ) );
  entries.push_back( std::make_pair( "../evil", "pwned" ) );
  entries.push_back( std::make_pair( "sub/../../../evil2", "pwned" ) );
  entries.push_back( std::make_pair( "../evil_dir/", "" ) );
  entries.push_back( std::make_pair( "also_ok/y", "fine" ) );
  ASSERT_TRUE( write_zip( archive, entries ) );

  const Op_error error = unpack_archive( options( 4, 4 ) );
  EXPECT_FALSE( error.ok() );
  EXPECT_EQ( ek_path_escape, error.kind );
  EXPECT_EQ( 2, error.retval );
  EXPECT_FALSE( test_util::exists( tmp( "out/evil" ) ) );
  EXPECT_FALSE( test_util::exists( tmp( "evil2" ) ) );
  EXPECT_FALSE( test_util::exists( tmp( "out/evil_dir" ) ) );
  EXPECT_EQ( "fine", test_util::read_file( dest + "/ok.txt" ) );
  EXPECT_EQ( "fine", test_util::read_file( dest + "/also_ok/y" ) );
  }


TEST_F( UnpackTest, DirectoryCreationIsIdempotent )
  {
  Entry_list entries;
  entries.push_back( std::make_pair( "d/e/f.txt", "f" ) );
  entries.push_back( std::make_pair( "d/", "" ) );
  entries.push_back( std::make_pair( "d/e/", "" ) );
  entries.push_back( std::make_pair( "x/y/z.txt", "z" ) );
  entries.push_back( std::make_pair( "d/", "" ) );
  ASSERT_TRUE( write_zip( archive, entries ) );
  ASSERT_TRUE( make_dir_path( dest + "/d" ) );

  for( int i = 0; i < 2; ++i )
    {
    const Op_error error = unpack_archive( options( 3, 3 ) );
    ASSERT_TRUE( error.ok() ) << error.msg;
    }
  EXPECT_EQ( "f", test_util::read_file( dest + "/d/e/f.txt" ) );
  EXPECT_EQ( "z", test_util::read_file( dest + "/x/y/z.txt" ) );
  }


TEST_F( UnpackTest, ConcurrentFilesNeverExceedPermits )
  {
  Entry_list entries;
  for( int i = 0; i < 40; ++i )
    {
    char name[32];
    snprintf( name, sizeof name, "dir%d/file%02d", i % 3, i );
    entries.push_back( std::make_pair( name, test_util::make_data( i, 3000 ) ) );
    }
  ASSERT_TRUE( write_zip( archive, entries ) );

  Counting_fs fs;
  Unpack_options opts( options( 8, 2 ) );
  opts.dest_fs = &fs;
  const Op_error error = unpack_archive( opts );
  ASSERT_TRUE( error.ok() ) << error.msg;
  EXPECT_EQ( 40, fs.files_created );
  EXPECT_GE( fs.max_open_files, 1 );
  EXPECT_LE( fs.max_open_files, 2 );
  for( unsigned i = 0; i < entries.size(); ++i )
    EXPECT_EQ( entries[i].second,
               test_util::read_file( dest + '/' + entries[i].first ) );
  }


TEST_F( UnpackTest, ManyWorkersFewPermitsFinish )
  {
  Entry_list entries;
  for( int i = 0; i < 30; ++i )
    {
    char name[32];
    snprintf( name, sizeof name, "f%02d", i );
    entries.push_back( std::make_pair( name, test_util::make_data( i, 500 ) ) );
    }
  ASSERT_TRUE( write_zip( archive, entries ) );
  for( int round = 0; round < 10; ++round )
    {
    Counting_fs fs;
    Unpack_options opts( options( 8, 2 ) );
    opts.dest_fs = &fs;
    const Op_error error = unpack_archive( opts );
    ASSERT_TRUE( error.ok() ) << error.msg;
    ASSERT_EQ( 30, fs.files_created ) << "round " << round;
    EXPECT_LE( fs.max_open_files, 2 );
    }
  }


TEST_F( UnpackTest, FirstErrorIsReportedAndOthersRestored )
  {
  Entry_list entries;
  entries.push_back( std::make_pair( "../evil", "pwned" ) );
  entries.push_back( std::make_pair( "sub/bad", "cannot be created" ) );
  for( int i = 0; i < 12; ++i )
    {
    char name[32];
    snprintf( name, sizeof name, "good%02d", i );
    entries.push_back( std::make_pair( name, std::string( name ) + " data" ) );
    }
  ASSERT_TRUE( write_zip( archive, entries ) );

  Failing_fs fs;
  Unpack_options opts( options( 4, 3 ) );
  opts.dest_fs = &fs;
  const Op_error error = unpack_archive( opts );
  ASSERT_FALSE( error.ok() );
  EXPECT_TRUE( error.kind == ek_path_escape || error.kind == ek_restore )
    << error.kind;
  EXPECT_NE( 0, error.retval );
  EXPECT_FALSE( test_util::exists( tmp( "out/evil" ) ) );
  EXPECT_FALSE( test_util::exists( dest + "/sub/bad" ) );
  for( unsigned i = 2; i < entries.size(); ++i )
    EXPECT_EQ( entries[i].second,
               test_util::read_file( dest + '/' + entries[i].first ) );
  }


TEST_F( UnpackTest, DamagedEntryIsRemovedUnlessKept )
  {
  Entry_list entries;
  entries.push_back( std::make_pair( "damaged", "some data to be damaged" ) );
  ASSERT_TRUE( write_zip( archive, entries ) );
  // change the CRC in the central directory
  std::string data( test_util::read_file( archive ) );
  const uint8_t * const eocd =
    (const uint8_t *)data.data() + data.size() - eocd_size;
  const unsigned long pos = get_le32( eocd + 16 );
  ASSERT_EQ( cdh_magic, get_le32( (const uint8_t *)data.data() + pos ) );
  data[pos+16] ^= 0xFF;
  ASSERT_TRUE( test_util::write_file( archive, data ) );

  Op_error error = unpack_archive( options( 1, 1 ) );
  EXPECT_EQ( ek_restore, error.kind );
  EXPECT_EQ( 2, error.retval );
  EXPECT_FALSE( test_util::exists( dest + "/damaged" ) );

  Unpack_options opts( options( 1, 1 ) );
  opts.keep_damaged = true;
  error = unpack_archive( opts );
  EXPECT_EQ( 2, error.retval );
  EXPECT_EQ( "some data to be damaged", test_util::read_file( dest + "/damaged" ) );
  }


TEST_F( UnpackTest, LastDuplicateNameWins )
  {
  Entry_list entries;
  for( int i = 0; i < 40; ++i )
    {
    char buf[32];
    snprintf( buf, sizeof buf, "version %d", i );
    entries.push_back( std::make_pair( ( i % 2 ) ? "dup.txt" : "./dup.txt",
                                       std::string( buf ) ) );
    }
  entries.push_back( std::make_pair( "other", "other contents" ) );
  ASSERT_TRUE( write_zip( archive, entries ) );
  for( int round = 0; round < 6; ++round )
    {
    const Op_error error = unpack_archive( options( 8, 8 ) );
    ASSERT_TRUE( error.ok() ) << error.msg;
    EXPECT_EQ( "version 39", test_util::read_file( dest + "/dup.txt" ) );
    EXPECT_EQ( "other contents", test_util::read_file( dest + "/other" ) );
    }
  }


TEST_F( UnpackTest, MissingOrInvalidArchive )
  {
  Op_error error = unpack_archive( options( 2, 2 ) );
  EXPECT_EQ( ek_restore, error.kind );
  EXPECT_EQ( 1, error.retval );
  ASSERT_TRUE( test_util::write_file( archive, "not a zip archive" ) );
  error = unpack_archive( options( 2, 2 ) );
  EXPECT_EQ( ek_restore, error.kind );
  EXPECT_EQ( 2, error.retval );
  }


TEST_F( UnpackTest, EmptyArchiveCreatesDestination )
  {
  ASSERT_TRUE( write_zip( archive, Entry_list() ) );
  const Op_error error = unpack_archive( options( 2, 2 ) );
  ASSERT_TRUE( error.ok() ) << error.msg;
  EXPECT_TRUE( test_util::is_dir( dest ) );
  }
