#include <ingestion/dump_rows.hpp>
#include <ingestion/field_normalizer.hpp>
#include <utils/errors.hpp>

namespace SixDegrees {

namespace {

// Rethrow with file position so a corrupt dump can be located
template <typename Fn>
auto at_line(const TsvRow& row, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const ParseError& e) {
        throw ParseError("line " + std::to_string(row.line()) + ": " + e.detail());
    }
}

} // namespace

MovieColumns MovieColumns::from(const TsvReader& reader) {
    return {
        reader.column("tconst"),
        reader.column("primaryTitle"),
        reader.column("startYear"),
        reader.column("titleType"),
        reader.column("isAdult"),
        reader.column("runtimeMinutes"),
        reader.column("genres"),
    };
}

PersonColumns PersonColumns::from(const TsvReader& reader) {
    return {
        reader.column("nconst"),
        reader.column("primaryName"),
        reader.column("birthYear"),
        reader.column("deathYear"),
        reader.column("knownForTitles"),
    };
}

RatingColumns RatingColumns::from(const TsvReader& reader) {
    return {
        reader.column("tconst"),
        reader.column("averageRating"),
        reader.column("numVotes"),
    };
}

EdgeColumns EdgeColumns::from(const TsvReader& reader) {
    return {
        reader.column("tconst"),
        reader.column("nconst"),
        reader.column("category"),
    };
}

MovieRecord parse_movie(const TsvRow& row, const MovieColumns& cols) {
    return at_line(row, [&] {
        MovieRecord m;
        m.id = parse_external_id(row.at(cols.id), kMoviePrefix);
        m.title = normalize_text(row.at(cols.title)).value_or("");
        m.year = normalize_integer(row.at(cols.year));
        m.title_type = normalize_category(row.at(cols.title_type));
        m.is_adult = normalize_integer(row.at(cols.is_adult)).value_or(0);
        m.runtime = normalize_integer(row.at(cols.runtime));
        m.genres = normalize_text(row.at(cols.genres));
        return m;
    });
}

PersonRecord parse_person(const TsvRow& row, const PersonColumns& cols) {
    return at_line(row, [&] {
        PersonRecord p;
        p.id = parse_external_id(row.at(cols.id), kPersonPrefix);
        p.name = normalize_text(row.at(cols.name)).value_or("");
        p.birth = normalize_integer(row.at(cols.birth));
        p.death = normalize_integer(row.at(cols.death));
        p.known_for = normalize_text(row.at(cols.known_for));
        if (p.known_for) {
            // Stored raw, but a malformed id here is as fatal as anywhere else
            parse_external_id_list(*p.known_for, kMoviePrefix);
        }
        return p;
    });
}

RatingRecord parse_rating(const TsvRow& row, const RatingColumns& cols) {
    return at_line(row, [&] {
        RatingRecord r;
        r.movie_id = parse_external_id(row.at(cols.movie_id), kMoviePrefix);
        r.average = normalize_decimal(row.at(cols.average));
        r.num_votes = normalize_integer(row.at(cols.num_votes));
        return r;
    });
}

EdgeRow parse_edge(const TsvRow& row, const EdgeColumns& cols) {
    return at_line(row, [&] {
        EdgeRow e;
        e.person_id = parse_external_id(row.at(cols.person_id), kPersonPrefix);
        e.movie_id = parse_external_id(row.at(cols.movie_id), kMoviePrefix);
        e.category = normalize_category(row.at(cols.category));
        return e;
    });
}

} // namespace SixDegrees
