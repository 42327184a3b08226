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

class Archive_attrs
  {
  struct stat ast;		// archive attributes at time of init
  bool isreg;

public:
  Archive_attrs() : isreg( false ) {}
  bool init( const int fd )
    {
    if( fstat( fd, &ast ) != 0 ) return false;
    if( S_ISREG( ast.st_mode ) ) isreg = true;
    return true;
    }
  bool is_the_archive( const struct stat & st ) const
    { return isreg && st.st_dev == ast.st_dev && st.st_ino == ast.st_ino; }
  };


struct Pack_options
  {
  std::string source;			// file or directory to archive
  std::string archive;			// name of the zip file to create
  std::vector< std::string > exclude_patterns;
  long long mtime;			// used if mtime_set
  int num_workers;			// 0 = number of online processors
  int out_slots;			// 0 = 2 * num_workers
  int level;				// compression level 0 .. 9
  int debug_level;
  bool mtime_set;

  Pack_options()
    : mtime( 0 ), num_workers( 0 ), out_slots( 0 ), level( 6 ),
      debug_level( 0 ), mtime_set( false ) {}
  };


// Result of the walk. Read-only while the workers run.
struct Pack_plan
  {
  const Pack_options & opts;
  std::string root;			// cleaned source path
  std::string base;			// prefix of entry names, may be empty
  std::vector< std::string > paths;	// sorted, index is sequence number
  Archive_attrs archive_attrs;
  bool isdir;				// root is a directory

  explicit Pack_plan( const Pack_options & o ) : opts( o ), isdir( false ) {}
  };


/* Unit produced by a packing worker for one path. Either nothing to write
   (root directory or skipped file), a directory entry (content == 0), a
   file entry, or an error (retval != 0). */
class Prepared_entry
  {
  Prepared_entry( const Prepared_entry & );	// declared as private
  void operator=( const Prepared_entry & );	// declared as private

public:
  const long seq;
  Zip_header header;
  const Content_source * content;	// owned, 0 for directories
  std::string estr;			// error or diagnostic message
  int retval;
  bool write;

  explicit Prepared_entry( const long s )
    : seq( s ), content( 0 ), retval( 0 ), write( false ) {}
  ~Prepared_entry() { if( content ) delete content; }
  };

typedef void (* Prepare_fn)( const Pack_plan & plan, const long seq,
                             Prepared_entry & entry );

// defined in create.cc
int walk_tree( const std::string & root,
               const std::vector< std::string > & exclude_patterns,
               std::vector< std::string > & paths, std::string & estr );
std::string entry_name( const Pack_plan & plan, const std::string & path,
                        std::string * const msgp = 0 );
void prepare_entry( const Pack_plan & plan, const long seq,
                    Prepared_entry & entry );
Op_error pack_archive( const Pack_options & opts,
                       const Prepare_fn prepare = prepare_entry );

// defined in create_mt.cc
Op_error encode_mt( const Pack_plan & plan, Zip_writer & writer,
                    const Prepare_fn prepare, const int num_workers,
                    const int out_slots, const int debug_level );
