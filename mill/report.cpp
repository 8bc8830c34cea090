//    --------------------------------------------------------------------
//
//    This file is part of fmill.
//
//    fmill is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    fmill is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with fmill. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#include "mill/report.h"
#include "mill/errors.h"

#include "db/sqlwrap.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "miscmath/miscmath.h"
#include "defs/defs.h"

#include <fstream>
#include <set>
#include <sstream>

extern logger_t logger;


static void check_combo( const fmill::combo_key_t & key ,
			 const fmill::combo_record_t & rec ,
			 const std::map<int,fmill::set_summary_t> & summaries )
{

  const std::string where = "set " + Helper::int2str( key.first ) + " combo " + key.second;

  if ( rec.set_id != key.first || rec.combo_id != key.second )
    throw fmill::malformed_aggregate_error( where + " holds a record for set "
					    + Helper::int2str( rec.set_id ) + " combo " + rec.combo_id );

  if ( summaries.find( key.first ) == summaries.end() )
    throw fmill::malformed_aggregate_error( where + " has no set summary" );

  if ( rec.troughs.size() == 0 )
    throw fmill::malformed_aggregate_error( where + " has no trials" );

  if ( rec.speed.size() != rec.troughs.size() || rec.distance.size() != rec.troughs.size() )
    throw fmill::malformed_aggregate_error( where + " has series of different lengths" );

  std::map<std::string,double>::const_iterator tt = rec.troughs.begin();
  while ( tt != rec.troughs.end() )
    {
      if ( ! rec.speed.count( tt->first ) || ! rec.distance.count( tt->first ) )
	throw fmill::malformed_aggregate_error( where + " chamber " + tt->first + " is missing a series value" );
      ++tt;
    }

}


fmill::report_tables_t fmill::render( const std::map<int,set_summary_t> & summaries ,
				      const std::map<combo_key_t,combo_record_t> & combos )
{

  //
  // validate everything before building any table
  //

  std::map<int,set_summary_t>::const_iterator ss = summaries.begin();
  while ( ss != summaries.end() )
    {
      if ( ss->first != ss->second.set_id )
	throw malformed_aggregate_error( "summary keyed as set " + Helper::int2str( ss->first )
					 + " describes set " + Helper::int2str( ss->second.set_id ) );
      if ( ss->second.total < 0 || ss->second.small_changes < 0 || ss->second.large_changes < 0 )
	throw malformed_aggregate_error( "set " + Helper::int2str( ss->first ) + " has negative counts" );
      ++ss;
    }

  std::set<std::string> chambers;

  std::map<combo_key_t,combo_record_t>::const_iterator cc = combos.begin();
  while ( cc != combos.end() )
    {
      check_combo( cc->first , cc->second , summaries );
      std::map<std::string,double>::const_iterator tt = cc->second.troughs.begin();
      while ( tt != cc->second.troughs.end() )
	{
	  chambers.insert( tt->first );
	  ++tt;
	}
      ++cc;
    }

  report_tables_t tables;

  //
  // summary
  //

  std::vector<int> set_id, total, small, large, no_change;
  std::vector<std::string> cids;
  std::vector<double> large_prop;

  ss = summaries.begin();
  while ( ss != summaries.end() )
    {
      const set_summary_t & s = ss->second;
      set_id.push_back( s.set_id );
      total.push_back( s.total );
      small.push_back( s.small_changes );
      large.push_back( s.large_changes );
      cids.push_back( s.large_cids.size() == 0 ? globals::none_label : Helper::stringize( s.large_cids ) );
      no_change.push_back( s.no_change() );
      large_prop.push_back( s.large_prop() );
      ++ss;
    }

  tables.summary.add( "set_id" , set_id );
  tables.summary.add( "total" , total );
  tables.summary.add( "small_changes" , small );
  tables.summary.add( "large_changes" , large );
  tables.summary.add( "large_cIDs" , cids );
  tables.summary.add( "no_change" , no_change );
  tables.summary.add( "large_prop" , large_prop );

  //
  // per statistic
  //

  std::vector<int> m_set, m_total, m_none, m_small, m_large;
  std::vector<std::string> m_stat;
  std::vector<double> m_prop;

  const std::vector<metric_t> metrics = globals::all_metrics();

  ss = summaries.begin();
  while ( ss != summaries.end() )
    {
      const set_summary_t & s = ss->second;
      for (int m=0; m<metrics.size(); m++)
	{
	  std::map<metric_t,metric_tally_t>::const_iterator mm = s.by_metric.find( metrics[m] );
	  if ( mm == s.by_metric.end() ) continue;
	  m_set.push_back( s.set_id );
	  m_stat.push_back( globals::metric_label( metrics[m] ) );
	  m_total.push_back( s.total );
	  m_none.push_back( s.no_change( metrics[m] ) );
	  m_small.push_back( mm->second.small );
	  m_large.push_back( mm->second.large );
	  m_prop.push_back( s.large_prop( metrics[m] ) );
	}
      ++ss;
    }

  tables.metrics.add( "set_id" , m_set );
  tables.metrics.add( "stat" , m_stat );
  tables.metrics.add( "total" , m_total );
  tables.metrics.add( "no_change" , m_none );
  tables.metrics.add( "small_changes" , m_small );
  tables.metrics.add( "large_changes" , m_large );
  tables.metrics.add( "large_prop" , m_prop );

  //
  // combos: chamber columns are the sorted union over all combos
  //

  std::vector<int> c_set, c_n;
  std::vector<std::string> c_combo, c_file, c_stat;
  std::vector<double> c_sum, c_mean;
  std::map<std::string,std::vector<double> > c_val;
  std::map<std::string,std::vector<bool> > c_miss;

  cc = combos.begin();
  while ( cc != combos.end() )
    {
      const combo_record_t & rec = cc->second;

      const std::string files = rec.labels.size() == 0 ? globals::missing_label : Helper::stringize( rec.labels );

      for (int m=0; m<metrics.size(); m++)
	{
	  const std::map<std::string,double> & series = rec.series( metrics[m] );

	  double sum = 0;
	  std::map<std::string,double>::const_iterator vv = series.begin();
	  while ( vv != series.end() )
	    {
	      sum += vv->second;
	      ++vv;
	    }

	  c_set.push_back( rec.set_id );
	  c_combo.push_back( rec.combo_id );
	  c_file.push_back( files );
	  c_stat.push_back( globals::metric_label( metrics[m] ) );
	  c_n.push_back( series.size() );
	  c_sum.push_back( sum );
	  c_mean.push_back( sum / (double)series.size() );

	  std::set<std::string>::const_iterator ch = chambers.begin();
	  while ( ch != chambers.end() )
	    {
	      std::map<std::string,double>::const_iterator ff = series.find( *ch );
	      const bool missing = ff == series.end();
	      c_val[ *ch ].push_back( missing ? 0 : ff->second );
	      c_miss[ *ch ].push_back( missing );
	      ++ch;
	    }
	}
      ++cc;
    }

  tables.combos.add( "set_id" , c_set );
  tables.combos.add( "combo_id" , c_combo );
  tables.combos.add( "filename" , c_file );
  tables.combos.add( "stat" , c_stat );
  tables.combos.add( "n" , c_n );
  tables.combos.add( "sum" , c_sum );
  tables.combos.add( "mean" , c_mean );

  std::set<std::string>::const_iterator ch = chambers.begin();
  while ( ch != chambers.end() )
    {
      tables.combos.add( chamber_column( *ch ) , c_val[ *ch ] , c_miss[ *ch ] );
      ++ch;
    }

  return tables;
}


std::string fmill::chamber_column( const std::string & chamber_id )
{
  return "c_" + chamber_id;
}


fmill::report_tables_t fmill::render( const aggregator_t & agg )
{
  return render( agg.summaries , agg.combos );
}


dtable_t fmill::render_trials( const std::vector<classified_trial_t> & trials )
{

  std::vector<int> set_id, troughs, nbouts, small, large;
  std::vector<std::string> combo, chamber, file, cid;
  std::vector<double> speed, distance, elapsed, flight_time, longest, prop;

  for (int i=0; i<trials.size(); i++)
    {
      const classified_trial_t & t = trials[i];
      set_id.push_back( t.signal.id.set_id );
      combo.push_back( t.signal.id.combo_id );
      chamber.push_back( t.signal.id.chamber_id );
      file.push_back( t.signal.label == "" ? globals::missing_label : t.signal.label );
      troughs.push_back( t.record.troughs );
      speed.push_back( t.record.speed );
      distance.push_back( t.record.distance );
      elapsed.push_back( t.record.elapsed );
      flight_time.push_back( t.bouts.flight_time );
      nbouts.push_back( t.bouts.n );
      longest.push_back( t.bouts.longest );
      prop.push_back( t.bouts.prop_flying );
      small.push_back( t.changes.small_changes );
      large.push_back( t.changes.large_changes );
      cid.push_back( t.changes.large_cids.size() == 0 ? globals::none_label : Helper::stringize( t.changes.large_cids ) );
    }

  dtable_t table;
  table.add( "set_id" , set_id );
  table.add( "combo_id" , combo );
  table.add( "chamber_id" , chamber );
  table.add( "filename" , file );
  table.add( "troughs" , troughs );
  table.add( "speed" , speed );
  table.add( "distance" , distance );
  table.add( "elapsed" , elapsed );
  table.add( "flight_time" , flight_time );
  table.add( "bouts" , nbouts );
  table.add( "longest_bout" , longest );
  table.add( "prop_flying" , prop );
  table.add( "small_changes" , small );
  table.add( "large_changes" , large );
  table.add( "large_cID" , cid );
  return table;
}


static std::string level_label( const change_level_t l )
{
  if ( l == LARGE_CHANGE ) return "large";
  if ( l == SMALL_CHANGE ) return "small";
  return "none";
}


dtable_t fmill::render_sweep( const std::vector<sweep_result_t> & results )
{

  const std::vector<metric_t> metrics = globals::all_metrics();

  const std::vector<double> devs = results.size() == 0 ? std::vector<double>() : results[0].devs;

  const int ncells = devs.size() * devs.size();

  std::vector<int> set_id;
  std::vector<std::string> combo, chamber, file, stat, level;
  std::vector<double> lo, hi, spread;
  std::vector<std::vector<double> > cells( ncells );

  for (int i=0; i<results.size(); i++)
    {
      const sweep_result_t & r = results[i];

      if ( r.devs != devs )
	throw malformed_aggregate_error( r.label + " was swept over a different deviation grid" );

      for (int m=0; m<metrics.size(); m++)
	{
	  std::map<metric_t,std::vector<double> >::const_iterator gg = r.grid.find( metrics[m] );
	  if ( gg == r.grid.end() || gg->second.size() != ncells )
	    throw malformed_aggregate_error( r.label + " has an incomplete "
					     + globals::metric_label( metrics[m] ) + " grid" );

	  const std::vector<double> & g = gg->second;

	  set_id.push_back( r.id.set_id );
	  combo.push_back( r.id.combo_id );
	  chamber.push_back( r.id.chamber_id );
	  file.push_back( r.label == "" ? globals::missing_label : r.label );
	  stat.push_back( globals::metric_label( metrics[m] ) );
	  lo.push_back( MiscMath::min( g ) );
	  hi.push_back( MiscMath::max( g ) );

	  std::map<metric_t,double>::const_iterator ss = r.spread.find( metrics[m] );
	  spread.push_back( ss == r.spread.end() ? hi.back() - lo.back() : ss->second );

	  std::map<metric_t,change_level_t>::const_iterator ll = r.changes.level.find( metrics[m] );
	  level.push_back( level_label( ll == r.changes.level.end() ? NO_CHANGE : ll->second ) );

	  for (int k=0; k<ncells; k++)
	    cells[k].push_back( g[k] );
	}
    }

  dtable_t table;
  table.add( "set_id" , set_id );
  table.add( "combo_id" , combo );
  table.add( "chamber_id" , chamber );
  table.add( "filename" , file );
  table.add( "stat" , stat );
  table.add( "min" , lo );
  table.add( "max" , hi );
  table.add( "spread" , spread );
  table.add( "change" , level );

  for (int i=0; i<devs.size(); i++)
    for (int j=0; j<devs.size(); j++)
      table.add( "g_" + Helper::dbl2str( devs[i] ) + "_" + Helper::dbl2str( devs[j] ) ,
		 cells[ i * devs.size() + j ] );

  return table;
}


dtable_t fmill::render_sweep_summary( const std::vector<sweep_result_t> & results )
{

  const std::vector<metric_t> metrics = globals::all_metrics();

  std::map<int,int> total;
  std::map<int,std::map<metric_t,metric_tally_t> > tally;
  std::map<int,std::map<metric_t,std::set<std::string> > > cids;

  for (int i=0; i<results.size(); i++)
    {
      const sweep_result_t & r = results[i];

      if ( ! r.id.has_set() )
	throw malformed_aggregate_error( r.label + " has no set id" );

      ++total[ r.id.set_id ];

      for (int m=0; m<metrics.size(); m++)
	{
	  std::map<metric_t,change_level_t>::const_iterator ll = r.changes.level.find( metrics[m] );
	  if ( ll == r.changes.level.end() ) continue;
	  metric_tally_t & t = tally[ r.id.set_id ][ metrics[m] ];
	  if ( ll->second == SMALL_CHANGE ) ++t.small;
	  else if ( ll->second == LARGE_CHANGE )
	    {
	      ++t.large;
	      cids[ r.id.set_id ][ metrics[m] ].insert( r.id.chamber_id );
	    }
	}
    }

  std::vector<int> set_id, n, none, small, large;
  std::vector<std::string> stat, large_cids;
  std::vector<double> prop;

  std::map<int,int>::const_iterator tt = total.begin();
  while ( tt != total.end() )
    {
      for (int m=0; m<metrics.size(); m++)
	{
	  const metric_tally_t t = tally[ tt->first ][ metrics[m] ];
	  const std::set<std::string> & c = cids[ tt->first ][ metrics[m] ];
	  set_id.push_back( tt->first );
	  stat.push_back( globals::metric_label( metrics[m] ) );
	  n.push_back( tt->second );
	  none.push_back( tt->second - t.small - t.large );
	  small.push_back( t.small );
	  large.push_back( t.large );
	  prop.push_back( t.large / (double)tt->second );
	  large_cids.push_back( c.size() == 0 ? globals::none_label : Helper::stringize( c ) );
	}
      ++tt;
    }

  dtable_t table;
  table.add( "set_id" , set_id );
  table.add( "stat" , stat );
  table.add( "total" , n );
  table.add( "no_change" , none );
  table.add( "small_changes" , small );
  table.add( "large_changes" , large );
  table.add( "large_prop" , prop );
  table.add( "large_cIDs" , large_cids );
  return table;
}


void fmill::write_tables( const report_tables_t & tables ,
			  const std::string & folder ,
			  const char delim )
{

  std::string root = folder == "" ? "." : folder;
  if ( root[ root.size() - 1 ] != globals::folder_delimiter )
    root += globals::folder_delimiter;

  std::vector<std::pair<std::string,const dtable_t*> > files;
  files.push_back( std::make_pair( "summary" , &tables.summary ) );
  files.push_back( std::make_pair( "combos" , &tables.combos ) );
  files.push_back( std::make_pair( "metrics" , &tables.metrics ) );
  files.push_back( std::make_pair( "trials" , &tables.trials ) );
  files.push_back( std::make_pair( "sweep" , &tables.sweep ) );
  files.push_back( std::make_pair( "sweep_summary" , &tables.sweep_summary ) );

  for (int i=0; i<files.size(); i++)
    {
      if ( files[i].second->nrows == -1 ) continue;

      const std::string filename = root + "diagnostics_" + files[i].first + ".csv";

      std::ofstream O1( filename.c_str() , std::ios::out );
      if ( ! O1.good() )
	Helper::halt( "could not write to " + filename );

      files[i].second->write( O1 , delim );
      O1.close();

      logger << "  wrote " << files[i].second->nrows << " row(s) to " << filename << "\n";
    }

}


//
// sqlite3 persistence: column types follow the first non-missing cell
//

void fmill::save_table( const dtable_t & table , const std::string & name , SQL & sql )
{

  if ( ! sql.is_open() )
    Helper::halt( "database not attached" );

  if ( table.nrows == -1 ) return;

  const int nc = table.ncols();

  std::vector<std::string> types( nc , "TEXT" );

  for (int j=0; j<nc; j++)
    for (int i=0; i<table.nrows; i++)
      {
	const dtable_elem_t & e = table.data[j][i];
	if ( std::holds_alternative<std::monostate>( e ) ) continue;
	if ( std::holds_alternative<int>( e ) ) types[j] = "INTEGER";
	else if ( std::holds_alternative<double>( e ) ) types[j] = "REAL";
	break;
      }

  std::stringstream create, insert;

  create << "CREATE TABLE " << name << " (";
  insert << "INSERT INTO " << name << " VALUES (";

  for (int j=0; j<nc; j++)
    {
      if ( j ) { create << " , "; insert << " , "; }
      create << "\"" << table.cols[j] << "\" " << types[j];
      insert << ":c" << j;
    }

  create << " );";
  insert << " );";

  sql.query( "DROP TABLE IF EXISTS " + name + ";" );

  if ( ! sql.query( create.str() ) )
    Helper::halt( "could not create table " + name );

  sqlite3_stmt * stmt = sql.prepare( insert.str() );
  if ( stmt == NULL )
    Helper::halt( "could not prepare insert into " + name );

  sql.begin();

  for (int i=0; i<table.nrows; i++)
    {
      for (int j=0; j<nc; j++)
	{
	  const std::string idx = ":c" + Helper::int2str( j );
	  const dtable_elem_t & e = table.data[j][i];

	  if ( std::holds_alternative<int>( e ) )
	    sql.bind_int( stmt , idx , std::get<int>( e ) );
	  else if ( std::holds_alternative<double>( e ) )
	    sql.bind_double( stmt , idx , std::get<double>( e ) );
	  else if ( std::holds_alternative<std::string>( e ) )
	    sql.bind_text( stmt , idx , std::get<std::string>( e ) );
	  else
	    sql.bind_null( stmt , idx );
	}

      sql.step( stmt );
      sql.reset( stmt );
    }

  sql.commit();

  sql.finalise( stmt );

}


void fmill::save_tables( const report_tables_t & tables , SQL & sql )
{
  save_table( tables.summary , "SUMMARY" , sql );
  save_table( tables.combos , "COMBOS" , sql );
  save_table( tables.metrics , "METRICS" , sql );
  save_table( tables.trials , "TRIALS" , sql );
  save_table( tables.sweep , "SWEEP" , sql );
  save_table( tables.sweep_summary , "SWEEP_SUMMARY" , sql );
}
