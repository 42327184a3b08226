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

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <new>
#include <unistd.h>
#include <sys/stat.h>
#include <ftw.h>

#include "parzip.h"
#include "common_mutex.h"
#include "zip_format.h"
#include "zip_writer.h"
#include "create.h"


namespace {

// nftw has no user argument. Only one walk at a time uses these.
const std::vector< std::string > * gexclude_patterns = 0;
std::vector< std::string > * gpaths = 0;
std::string * gestr = 0;
unsigned groot_size = 0;


int add_path( const char * const filename, const struct stat *,
              const int flag, struct FTW * const ftwbuf )
  {
  if( flag == FTW_NS )
    { format_file_error( *gestr, filename, cant_stat, errno ); return 1; }
  if( flag == FTW_DNR )
    { format_file_error( *gestr, filename, "Can't open directory", errno );
      return 1; }
  if( ftwbuf->level > 0 )			// never exclude the root
    {
    const char * sub = filename + groot_size;	// match below the root only
    while( *sub == '/' ) ++sub;
    if( Exclude::excluded( *gexclude_patterns, sub ) ) return 0;
    }
  gpaths->push_back( filename );
  return 0;
  }


// Streams the data of a regular file into the archive when committed.
class File_source : public Content_source
  {
  const std::string filename;

public:
  explicit File_source( const std::string & name ) : filename( name ) {}

  int write_to( Data_sink & sink, std::string & estr ) const
    {
    const int infd = open_instream( filename.c_str(), &estr );
    if( infd < 0 ) return 1;
    enum { bufsize = 65536 };
    uint8_t buf[bufsize];
    int retval = 0;
    while( true )
      {
      const int rd = readblock( infd, buf, bufsize );
      if( rd > 0 && !sink.write( buf, rd ) ) { retval = 1; break; }
      if( rd < bufsize )
        {
        if( errno )
          { format_file_error( estr, filename.c_str(), rd_err_msg, errno );
            retval = 1; }
        break;
        }
      }
    if( close( infd ) != 0 && retval == 0 )
      { format_file_error( estr, filename.c_str(), eclosf_msg, errno );
        retval = 1; }
    return retval;
    }
  };

} // end namespace


/* Collect root and everything below it, without following symbolic
   links, into paths sorted by name. Return 0 if OK, or 1 with a message
   in estr if any path can't be read. */
int walk_tree( const std::string & root,
               const std::vector< std::string > & exclude_patterns,
               std::vector< std::string > & paths, std::string & estr )
  {
  static pthread_mutex_t mutex = PTHREAD_MUTEX_INITIALIZER;

  paths.clear();
  xlock( &mutex );
  gexclude_patterns = &exclude_patterns; gpaths = &paths; gestr = &estr;
  groot_size = root.size();
  const std::string::size_type old_size = estr.size();
  const int ret = nftw( root.c_str(), add_path, 16, FTW_PHYS );
  const int saved_errno = errno;
  gexclude_patterns = 0; gpaths = 0; gestr = 0; groot_size = 0;
  xunlock( &mutex );
  if( ret != 0 )
    {
    if( estr.size() == old_size )		// nftw itself failed
      format_file_error( estr, root.c_str(), cant_stat, saved_errno );
    paths.clear();
    return 1;
    }
  std::sort( paths.begin(), paths.end() );
  return 0;
  }


/* Return the name of path inside the archive. Directory archives prefix
   the names with the base name of the root. If a prefix is removed and
   msgp is not null, a message is returned in *msgp. */
std::string entry_name( const Pack_plan & plan, const std::string & path,
                        std::string * const msgp )
  {
  std::string name;
  if( !plan.isdir ) name = plan.base.empty() ? base_name( path ) : plan.base;
  else
    {
    std::string::size_type i = std::min( plan.root.size(), path.size() );
    while( i < path.size() && path[i] == '/' ) ++i;
    const std::string sub( path, i );
    if( plan.base.empty() ) name = sub;
    else if( sub.empty() ) name = plan.base;
    else { name = plan.base; name += '/'; name += sub; }
    }
  std::string removed_prefix;
  const char * const stored_name =
    remove_leading_dotslash( name.c_str(), &removed_prefix, true );
  if( msgp && print_removed_prefix( removed_prefix, msgp ) ) *msgp += '\n';
  return stored_name;
  }


/* Stat one path of the plan and fill entry. Errors are stored in entry
   and reported by the muxer in sequence order. */
void prepare_entry( const Pack_plan & plan, const long seq,
                    Prepared_entry & entry )
  {
  const std::string & path = plan.paths[seq];
  struct stat st;
  if( stat( path.c_str(), &st ) != 0 )		// follow symbolic links
    { format_file_error( entry.estr, path.c_str(), cant_stat, errno );
      entry.retval = 1; return; }
  if( plan.archive_attrs.is_the_archive( st ) )
    { format_file_error( entry.estr, path.c_str(), itself_msg ); return; }
  const bool isdir = S_ISDIR( st.st_mode );
  if( isdir && plan.isdir && path == plan.root ) return;	// implicit root
  if( !isdir && !S_ISREG( st.st_mode ) )
    { format_file_error( entry.estr, path.c_str(),
                         "Unknown file type; not dumped." ); return; }

  std::string msg;
  Zip_header & header = entry.header;
  header.name = entry_name( plan, path, &msg );
  if( header.name.empty() || header.name == "." )
    { format_file_error( entry.estr, path.c_str(), "Empty entry name." );
      entry.retval = 1; return; }
  if( isdir ) header.name += '/';
  if( header.name.size() > max16 )
    { format_file_error( entry.estr, path.c_str(), "File name too long." );
      entry.retval = 1; return; }
  entry.estr += msg;
  header.mtime = plan.opts.mtime_set ? plan.opts.mtime : st.st_mtime;
  if( isdir )
    { header.mode = S_IFDIR | ( st.st_mode & 07777 );
      header.method = method_store; }
  else
    {
    header.mode = S_IFREG | ( st.st_mode & 07777 );
    header.method = method_deflate;
    header.usize = st.st_size;
    entry.content = new( std::nothrow ) File_source( path );
    if( !entry.content ) { show_error( mem_msg ); exit_fail_mt(); }
    }
  entry.write = true;
  }


Op_error pack_archive( const Pack_options & opts, const Prepare_fn prepare )
  {
  Op_error error;
  std::string estr;
  Pack_plan plan( opts );
  plan.root = clean_path( opts.source );
  struct stat st;
  if( stat( plan.root.c_str(), &st ) != 0 )
    { format_file_error( estr, opts.source.c_str(), cant_stat, errno );
      error.set( ek_traversal, 1, estr ); return error; }
  plan.isdir = S_ISDIR( st.st_mode );
  const std::string base( base_name( plan.root ) );
  if( base != "." && base != ".." && base != "/" ) plan.base = base;
  if( walk_tree( plan.root, opts.exclude_patterns, plan.paths, estr ) != 0 )
    { error.set( ek_traversal, 1, estr ); return error; }

  const char * const archive_namep = opts.archive.c_str();
  if( !make_dirs( opts.archive ) )
    { format_file_error( estr, archive_namep, intdir_msg, errno );
      error.set( ek_write, 1, estr ); return error; }
  const int outfd = open_outstream( opts.archive, &estr );
  if( outfd < 0 ) { error.set( ek_write, 1, estr ); return error; }
  if( !plan.archive_attrs.init( outfd ) )
    { format_file_error( estr, archive_namep, "Can't stat archive", errno );
      close( outfd ); error.set( ek_write, 1, estr ); return error; }

  int num_workers = opts.num_workers;
  if( num_workers <= 0 )
    num_workers = std::max( 1L, sysconf( _SC_NPROCESSORS_ONLN ) );
  const int out_slots = ( opts.out_slots > 0 ) ? opts.out_slots :
                        2 * num_workers;
  const int level = std::min( 9, std::max( 0, opts.level ) );
  Zip_writer writer( outfd, opts.archive, level );
  error = encode_mt( plan, writer, prepare, num_workers, out_slots,
                     opts.debug_level );
  if( error.ok() && writer.finish( estr ) != 0 )
    error.set( ek_write, 1, estr );
  if( close( outfd ) != 0 && error.ok() )
    { format_file_error( estr, archive_namep, eclosa_msg, errno );
      error.set( ek_write, 1, estr ); }
  return error;
  }
