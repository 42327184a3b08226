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

#include <string>
#include <vector>
#include <utime.h>
#include <gtest/gtest.h>

#include "parzip.h"
#include "common_mutex.h"
#include "zip_format.h"
#include "zip_index.h"
#include "zip_writer.h"
#include "create.h"
#include "test_util.h"

namespace {

// later paths are prepared faster, so entries arrive out of order
void reversed_prepare( const Pack_plan & plan, const long seq,
                       Prepared_entry & entry )
  {
  usleep( ( plan.paths.size() - seq ) % 5 * 3000 );
  prepare_entry( plan, seq, entry );
  }

// the first paths take the longest
void slow_start_prepare( const Pack_plan & plan, const long seq,
                         Prepared_entry & entry )
  {
  usleep( ( plan.paths.size() - seq ) * 5000 );
  prepare_entry( plan, seq, entry );
  }

// uneven delays, 0 to 4 ms
void jittery_prepare( const Pack_plan & plan, const long seq,
                      Prepared_entry & entry )
  {
  usleep( ( seq * 7 ) % 5 * 1000 );
  prepare_entry( plan, seq, entry );
  }


std::vector< std::string > archive_names( const std::string & archive )
  {
  std::vector< std::string > names;
  const int fd = open_instream( archive.c_str() );
  if( fd < 0 ) return names;
  const Zip_index index( fd );
  for( long i = 0; i < index.entries(); ++i )
    names.push_back( index.entry( i ).name );
  close( fd );
  return names;
  }


class PackTest : public ::testing::Test
  {
protected:
  test_util::Temp_dir tmp;
  std::string src;
  std::vector< std::string > expected;	// names in walk order

  void SetUp()
    {
    ASSERT_TRUE( tmp.ok() );
    src = tmp( "src" );
    const char * const files[] =
      { "b.txt", "a/x", "a/y", "a/sub/z", "a-b", "c/d/e", "big" };
    for( unsigned i = 0; i < sizeof files / sizeof files[0]; ++i )
      ASSERT_TRUE( test_util::write_file( src + '/' + files[i],
        test_util::make_data( i, ( i == 6 ) ? 200000 : 100 + 37 * i ) ) );
    ASSERT_TRUE( make_dir_path( src + "/empty" ) );
    const char * const names[] =
      { "src/a/", "src/a-b", "src/a/sub/", "src/a/sub/z", "src/a/x",
        "src/a/y", "src/b.txt", "src/big", "src/c/", "src/c/d/",
        "src/c/d/e", "src/empty/" };
    expected.assign( names, names + sizeof names / sizeof names[0] );
    }

  Pack_options options( const std::string & archive, const int workers )
    {
    Pack_options opts;
    opts.source = src;
    opts.archive = archive;
    opts.num_workers = workers;
    opts.out_slots = 2;
    opts.mtime = 1600000000;
    opts.mtime_set = true;
    return opts;
    }
  };

} // end namespace


TEST_F( PackTest, CommitOrderIsWalkOrder )
  {
  const std::string archive = tmp( "out.zip" );
  const Op_error error = pack_archive( options( archive, 8 ), reversed_prepare );
  ASSERT_TRUE( error.ok() ) << error.msg;
  EXPECT_EQ( expected, archive_names( archive ) );
  }


TEST_F( PackTest, OutputIsIndependentOfTiming )
  {
  const std::string archive1 = tmp( "out1.zip" );
  const std::string archive2 = tmp( "out2.zip" );
  const std::string archive3 = tmp( "out3.zip" );
  ASSERT_TRUE( pack_archive( options( archive1, 1 ) ).ok() );
  ASSERT_TRUE( pack_archive( options( archive2, 8 ), reversed_prepare ).ok() );
  // touching the tree doesn't change an archive with forced mtime
  struct utimbuf t;
  t.actime = t.modtime = 1234567890;
  ASSERT_EQ( 0, utime( ( src + "/b.txt" ).c_str(), &t ) );
  Pack_options opts( options( archive3, 3 ) );
  opts.out_slots = 0;				// default
  ASSERT_TRUE( pack_archive( opts, slow_start_prepare ).ok() );
  const std::string data1 = test_util::read_file( archive1 );
  EXPECT_FALSE( data1.empty() );
  EXPECT_TRUE( data1 == test_util::read_file( archive2 ) );
  EXPECT_TRUE( data1 == test_util::read_file( archive3 ) );
  }


TEST_F( PackTest, ImplicitRootHasNoEntry )
  {
  const std::string archive = tmp( "out.zip" );
  ASSERT_TRUE( pack_archive( options( archive, 4 ) ).ok() );
  const std::vector< std::string > names = archive_names( archive );
  ASSERT_FALSE( names.empty() );
  for( unsigned i = 0; i < names.size(); ++i )
    {
    EXPECT_NE( "src/", names[i] );
    EXPECT_EQ( 0U, names[i].find( "src/" ) );
    }
  }


TEST_F( PackTest, SingleFileUsesBaseName )
  {
  const std::string file = tmp( "deep/er/still/file.txt" );
  ASSERT_TRUE( test_util::write_file( file, "single" ) );
  Pack_options opts( options( tmp( "single.zip" ), 4 ) );
  opts.source = file;
  ASSERT_TRUE( pack_archive( opts ).ok() );
  const std::vector< std::string > names = archive_names( opts.archive );
  ASSERT_EQ( 1U, names.size() );
  EXPECT_EQ( "file.txt", names[0] );
  }


TEST_F( PackTest, EarliestPrepareErrorWins )
  {
  ASSERT_EQ( 0, symlink( "missing1", ( src + "/b_link" ).c_str() ) );
  ASSERT_EQ( 0, symlink( "missing2", ( src + "/d_link" ).c_str() ) );
  for( int i = 0; i < 3; ++i )
    {
    const Op_error error =
      pack_archive( options( tmp( "out.zip" ), 8 ), slow_start_prepare );
    ASSERT_FALSE( error.ok() );
    EXPECT_EQ( ek_prepare, error.kind );
    EXPECT_EQ( 1, error.retval );
    EXPECT_NE( std::string::npos, error.msg.find( "b_link" ) ) << error.msg;
    EXPECT_EQ( std::string::npos, error.msg.find( "d_link" ) ) << error.msg;
    }
  }


TEST_F( PackTest, SymlinkIsFollowed )
  {
  ASSERT_EQ( 0, symlink( "b.txt", ( src + "/link" ).c_str() ) );
  const std::string archive = tmp( "out.zip" );
  ASSERT_TRUE( pack_archive( options( archive, 4 ) ).ok() );
  const int fd = open_instream( archive.c_str() );
  ASSERT_GE( fd, 0 );
  const Zip_index index( fd );
  bool found = false;
  for( long i = 0; i < index.entries(); ++i )
    if( index.entry( i ).name == "src/link" )
      {
      found = true;
      EXPECT_FALSE( index.entry( i ).isdir() );
      EXPECT_EQ( test_util::read_file( src + "/b.txt" ).size(),
                 index.entry( i ).usize );
      }
  EXPECT_TRUE( found );
  close( fd );
  }


TEST_F( PackTest, ArchiveDoesNotContainItself )
  {
  const std::string archive = src + "/self.zip";
  ASSERT_TRUE( test_util::write_file( archive, "old contents" ) );
  ASSERT_TRUE( pack_archive( options( archive, 4 ) ).ok() );
  EXPECT_EQ( expected, archive_names( archive ) );
  }


TEST_F( PackTest, ExcludedFilesAreNotArchived )
  {
  Pack_options opts( options( tmp( "out.zip" ), 4 ) );
  opts.exclude_patterns.push_back( "a" );
  opts.exclude_patterns.push_back( "big" );
  ASSERT_TRUE( pack_archive( opts ).ok() );
  const char * const names[] =
    { "src/a-b", "src/b.txt", "src/c/", "src/c/d/", "src/c/d/e",
      "src/empty/" };
  EXPECT_EQ( std::vector< std::string >( names, names + 6 ),
             archive_names( opts.archive ) );
  }


TEST_F( PackTest, ArchiveParentDirectoriesAreCreated )
  {
  const std::string archive = tmp( "new/dir/out.zip" );
  ASSERT_TRUE( pack_archive( options( archive, 2 ) ).ok() );
  EXPECT_EQ( expected, archive_names( archive ) );
  }


TEST_F( PackTest, MissingSourceIsTraversalError )
  {
  Pack_options opts( options( tmp( "out.zip" ), 2 ) );
  opts.source = tmp( "missing" );
  const Op_error error = pack_archive( opts );
  EXPECT_EQ( ek_traversal, error.kind );
  EXPECT_EQ( 1, error.retval );
  EXPECT_FALSE( test_util::exists( opts.archive ) );
  }


TEST_F( PackTest, UnreadableSubdirectoryIsTraversalError )
  {
  if( geteuid() == 0 ) GTEST_SKIP() << "root can read any directory";
  const std::string locked = src + "/c/d";
  ASSERT_EQ( 0, chmod( locked.c_str(), 0 ) );
  Pack_options opts( options( tmp( "out.zip" ), 4 ) );
  const Op_error error = pack_archive( opts );
  chmod( locked.c_str(), 0755 );
  EXPECT_EQ( ek_traversal, error.kind );
  EXPECT_EQ( 1, error.retval );
  EXPECT_NE( std::string::npos, error.msg.find( "c/d" ) ) << error.msg;
  EXPECT_FALSE( test_util::exists( opts.archive ) );
  }


TEST_F( PackTest, ExcludeDoesNotMatchAboveSource )
  {
  Pack_options opts( options( tmp( "out.zip" ), 4 ) );
  opts.exclude_patterns.push_back( "parzip_test.*" );
  ASSERT_TRUE( pack_archive( opts ).ok() );
  EXPECT_EQ( expected, archive_names( opts.archive ) );
  }


TEST_F( PackTest, UnwritableArchiveIsWriteError )
  {
  ASSERT_TRUE( test_util::write_file( tmp( "file" ), "x" ) );
  const Op_error error = pack_archive( options( tmp( "file/out.zip" ), 2 ) );
  EXPECT_EQ( ek_write, error.kind );
  EXPECT_EQ( 1, error.retval );
  }


TEST_F( PackTest, EntryNamesDropDotdotPrefixes )
  {
  Pack_options opts( options( tmp( "out.zip" ), 1 ) );
  Pack_plan plan( opts );
  plan.root = "../../src";
  plan.base = "";
  plan.isdir = true;
  EXPECT_EQ( "a/x", entry_name( plan, "../../src/a/x" ) );
  plan.base = "src";
  EXPECT_EQ( "src/a/x", entry_name( plan, "../../src/a/x" ) );
  plan.isdir = false;
  plan.base = "";
  EXPECT_EQ( "x", entry_name( plan, "../../x" ) );
  }


TEST_F( PackTest, FullDeviceIsWriteError )
  {
  if( !test_util::exists( "/dev/full" ) ) GTEST_SKIP() << "no /dev/full";
  const Op_error error = pack_archive( options( "/dev/full", 4 ) );
  EXPECT_EQ( ek_write, error.kind );
  EXPECT_EQ( 1, error.retval );
  EXPECT_FALSE( error.msg.empty() );
  }


TEST_F( PackTest, FewSlotsManyWorkersFinish )
  {
  for( int i = 0; i < 30; ++i )
    ASSERT_TRUE( test_util::write_file( src + "/many/f" + char( 'a' + i ),
                                        test_util::make_data( i, 500 ) ) );
  const std::string archive = tmp( "out.zip" );
  std::string first;
  for( int round = 0; round < 20; ++round )
    {
    Pack_options opts( options( archive, 8 ) );
    opts.out_slots = 2;
    const Op_error error = pack_archive( opts, jittery_prepare );
    ASSERT_TRUE( error.ok() ) << error.msg;
    const std::string data = test_util::read_file( archive );
    if( round == 0 ) first = data;
    else ASSERT_TRUE( data == first ) << "round " << round;
    }
  EXPECT_EQ( expected.size() + 31, archive_names( archive ).size() );
  }
