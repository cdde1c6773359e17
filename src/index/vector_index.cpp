#include "index/vector_index.h"
#include "storage/key_schema.h"
#include "utils/logger.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <mutex>

namespace trivium {

VectorIndexManager::VectorIndexManager(RocksDBWrapper& db) : db_(db) {}

float VectorIndexManager::l2(const std::vector<float>& a, const std::vector<float>& b) {
	float s = 0.0f;
	for (size_t i = 0; i < a.size(); ++i) {
		float d = a[i] - b[i];
		s += d * d;
	}
	return std::sqrt(s);
}

float VectorIndexManager::cosineOneMinus(const std::vector<float>& a, const std::vector<float>& b) {
	float dot = 0.0f, na = 0.0f, nb = 0.0f;
	for (size_t i = 0; i < a.size(); ++i) {
		dot += a[i] * b[i];
		na += a[i] * a[i];
		nb += b[i] * b[i];
	}
	float denom = std::sqrt(std::max(na * nb, 1e-12f));
	float cosv = denom > 0 ? (dot / denom) : 0.0f;
	return 1.0f - cosv;
}

std::string VectorIndexManager::encodeVector(const std::vector<float>& v) {
	std::string out(v.size() * sizeof(float), '\0');
	if (!v.empty()) std::memcpy(out.data(), v.data(), out.size());
	return out;
}

std::optional<std::vector<float>> VectorIndexManager::decodeVector(std::string_view blob) {
	if (blob.size() % sizeof(float) != 0) return std::nullopt;
	std::vector<float> v(blob.size() / sizeof(float));
	if (!v.empty()) std::memcpy(v.data(), blob.data(), blob.size());
	return v;
}

VectorIndexManager::Status VectorIndexManager::addVector(const EmbeddingDefinition& embedding, std::string_view pk,
                                                         const std::vector<float>& vec) {
	if (!db_.isOpen()) return Status::Error("addVector: Datenbank ist nicht geöffnet");
	if (!KeySchema::isValidSegment(embedding.name)) return Status::Error("addVector: invalid embedding name");
	if (!KeySchema::isValidSegment(pk)) return Status::Error("addVector: invalid pk '" + std::string(pk) + "'");
	if (vec.empty()) return Status::Error("addVector: Vektor darf nicht leer sein");
	if (embedding.dimensions > 0 && vec.size() != embedding.dimensions) {
		return Status::Error("addVector: expected " + std::to_string(embedding.dimensions) +
		                     " dimensions, got " + std::to_string(vec.size()));
	}

	if (!db_.put(KeySchema::makeEmbeddingKey(embedding.name, pk), encodeVector(vec))) {
		return Status::Error("addVector: RocksDB put failed");
	}

	std::unique_lock lock(mutex_);
	auto it = cache_.find(embedding.name);
	if (it != cache_.end()) it->second[std::string(pk)] = vec;
	return Status::OK();
}

VectorIndexManager::Status VectorIndexManager::removeVector(std::string_view embedding, std::string_view pk) {
	if (!db_.isOpen()) return Status::Error("removeVector: Datenbank ist nicht geöffnet");
	if (!db_.del(KeySchema::makeEmbeddingKey(embedding, pk))) {
		return Status::Error("removeVector: RocksDB delete failed");
	}
	std::unique_lock lock(mutex_);
	auto it = cache_.find(std::string(embedding));
	if (it != cache_.end()) it->second.erase(std::string(pk));
	return Status::OK();
}

std::optional<std::vector<float>> VectorIndexManager::getVector(std::string_view embedding, std::string_view pk) const {
	auto blob = db_.get(KeySchema::makeEmbeddingKey(embedding, pk));
	if (!blob) return std::nullopt;
	return decodeVector(*blob);
}

VectorIndexManager::Status VectorIndexManager::loadSpace_(const std::string& embedding) const {
	Space space;
	size_t corrupt = 0;
	bool scanned = db_.scanPrefix(KeySchema::makeEmbeddingPrefix(embedding), [&](std::string_view key, std::string_view value) {
		auto v = decodeVector(value);
		if (!v) {
			++corrupt;
			return true;
		}
		space.emplace(KeySchema::extractId(key), std::move(*v));
		return true;
	});
	if (!scanned) return Status::Error("loadSpace: scan of " + embedding + " failed");
	if (corrupt > 0) {
		TRIVIUM_WARN("VectorIndex: {} corrupt vector(s) skipped in {}", corrupt, embedding);
	}
	TRIVIUM_DEBUG("VectorIndex: loaded {} vector(s) for {}", space.size(), embedding);

	std::unique_lock lock(mutex_);
	cache_[embedding] = std::move(space);
	return Status::OK();
}

VectorIndexManager::Status VectorIndexManager::rebuildFromStorage(std::string_view embedding) {
	if (!db_.isOpen()) return Status::Error("rebuildFromStorage: Datenbank ist nicht geöffnet");
	return loadSpace_(std::string(embedding));
}

size_t VectorIndexManager::getVectorCount(std::string_view embedding) const {
	std::shared_lock lock(mutex_);
	auto it = cache_.find(std::string(embedding));
	return it == cache_.end() ? 0 : it->second.size();
}

std::vector<VectorIndexManager::Result>
VectorIndexManager::bruteForceSearch_(const Space& space, const std::vector<float>& query, size_t k,
                                      Metric metric, const std::vector<std::string>* whitelist) const {
	std::vector<Result> results;
	auto consider = [&](const std::string& pk, const std::vector<float>& vec) {
		if (vec.size() != query.size()) return; // andere Dimension
		float dist = (metric == Metric::L2) ? l2(query, vec) : cosineOneMinus(query, vec);
		results.push_back({pk, dist});
	};

	if (whitelist) {
		for (const auto& pk : *whitelist) {
			auto it = space.find(pk);
			if (it != space.end()) consider(pk, it->second);
		}
	} else {
		for (const auto& [pk, vec] : space) consider(pk, vec);
	}

	auto byDistance = [](const Result& a, const Result& b) {
		return a.distance < b.distance || (a.distance == b.distance && a.pk < b.pk);
	};
	if (results.size() > k) {
		std::partial_sort(results.begin(), results.begin() + static_cast<std::ptrdiff_t>(k), results.end(), byDistance);
		results.resize(k);
	} else {
		std::sort(results.begin(), results.end(), byDistance);
	}
	return results;
}

std::pair<VectorIndexManager::Status, std::vector<VectorIndexManager::Result>>
VectorIndexManager::searchKnn(std::string_view embedding, const std::vector<float>& query, size_t k,
                              Metric metric, const std::vector<std::string>* whitelistPks) const {
	if (!db_.isOpen()) return {Status::Error("searchKnn: Datenbank ist nicht geöffnet"), {}};
	if (query.empty()) return {Status::Error("searchKnn: Query-Vektor ist leer"), {}};
	if (k == 0 || (whitelistPks && whitelistPks->empty())) return {Status::OK(), {}};

	const std::string name(embedding);
	{
		std::shared_lock lock(mutex_);
		auto it = cache_.find(name);
		if (it != cache_.end()) {
			return {Status::OK(), bruteForceSearch_(it->second, query, k, metric, whitelistPks)};
		}
	}
	auto st = loadSpace_(name);
	if (!st.ok) return {st, {}};

	std::shared_lock lock(mutex_);
	return {Status::OK(), bruteForceSearch_(cache_.at(name), query, k, metric, whitelistPks)};
}

std::pair<VectorIndexManager::Status, std::vector<std::string>>
VectorIndexManager::searchIds(const EmbeddingDefinition& embedding,
                              const std::vector<float>& queryVector,
                              size_t limit,
                              std::optional<double> threshold,
                              bool isL2Distance,
                              RestrictSet restrict) const {
	const Metric metric = isL2Distance ? Metric::L2 : Metric::COSINE;
	// Schwellwert vor dem Top-k-Schnitt anwenden: alle Kandidaten ranken
	const size_t k = threshold ? std::numeric_limits<size_t>::max() : limit;
	auto [st, hits] = searchKnn(embedding.name, queryVector, k, metric, restrict);
	if (!st.ok) return {st, {}};

	std::vector<std::string> ids;
	ids.reserve(std::min(hits.size(), limit));
	for (const auto& h : hits) {
		if (ids.size() >= limit) break;
		if (threshold) {
			if (isL2Distance) {
				if (h.distance > *threshold) continue;
			} else if (1.0 - static_cast<double>(h.distance) < *threshold) {
				continue; // Cosine-Similarity unter Schwelle
			}
		}
		ids.push_back(h.pk);
	}
	return {Status::OK(), std::move(ids)};
}

} // namespace trivium
