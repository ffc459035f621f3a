// ChunkCodec.h — Разбиение файла на chunk'и, XOR-parity и сборка блоков
//
// Файл делится на блоки по N data chunk'ов. Для блока с P parity chunk'ами
// parity p = XOR всех data слотов j, где j % P == p. Каждая такая группа
// восстанавливает ровно одну потерю. Parity никогда не применяется
// к слотам другого блока.

#pragma once

#include "../export.h"
#include "../TransferConfig.h"
#include <string>
#include <vector>
#include <optional>
#include <bitset>
#include <cstdint>
#include <cstddef>

namespace Innerocket {

// ═══════════════════════════════════════════════════════════
// BlockLayout — геометрия одного FEC блока
// ═══════════════════════════════════════════════════════════

struct IR_API BlockLayout {
    int64_t blockOffset = 0;        // Смещение первого data chunk'а в файле
    uint32_t blockSize = 0;         // Байт данных в блоке
    uint32_t firstIndex = 0;        // Глобальный индекс первого data chunk'а
    uint32_t chunkCount = 0;        // Data chunk'ов в блоке (<= 64)
    uint32_t chunkSize = 0;         // Номинальный размер chunk'а в блоке
    uint32_t parityCount = 0;       // Parity chunk'ов в блоке

    /// Смещение data слота в файле
    int64_t chunkOffset(uint32_t slot) const;

    /// Реальная длина data слота (последний может быть короче)
    uint32_t chunkLength(uint32_t slot) const;

    /// Длина parity chunk'а = максимальная длина слота в его группе
    uint32_t parityLength(uint32_t parityIndex) const;

    /// Битовая маска всех data слотов блока
    uint64_t dataMask() const;

    /// Битовая маска слотов, покрываемых parity chunk'ом
    uint64_t parityCoverage(uint32_t parityIndex) const;

    /// Номер parity группы для слота
    uint32_t groupOf(uint32_t slot) const { return parityCount ? slot % parityCount : 0; }

    int64_t endOffset() const { return blockOffset + blockSize; }

    bool operator==(const BlockLayout& other) const;
    bool operator!=(const BlockLayout& other) const { return !(*this == other); }
};

// ═══════════════════════════════════════════════════════════
// ChunkDescriptor — план одного chunk'а (без данных)
// ═══════════════════════════════════════════════════════════

struct IR_API ChunkDescriptor {
    BlockLayout block;
    uint32_t index = 0;             // Глобальный индекс (для parity: firstIndex блока)
    bool isParity = false;
    uint32_t parityIndex = 0;
    int64_t offset = 0;             // Для data: смещение в файле
    uint32_t length = 0;
    uint64_t chunkMap = 0;          // data: все слоты блока; parity: покрытие группы
};

// ═══════════════════════════════════════════════════════════
// ChunkMessage — chunk в том виде, в каком он идёт по сети
// ═══════════════════════════════════════════════════════════

struct IR_API ChunkMessage {
    std::string transferId;
    uint32_t index = 0;
    uint32_t totalChunks = 0;       // Оценка общего числа data chunk'ов
    std::vector<uint8_t> payload;
    bool isParityChunk = false;
    uint32_t parityIndex = 0;
    uint32_t totalParityChunks = 0;
    int64_t blockOffset = 0;
    uint32_t blockSize = 0;
    uint64_t chunkMap = 0;

    int64_t offset = 0;
    uint32_t blockFirstIndex = 0;
    uint32_t blockChunkCount = 0;
    uint32_t blockChunkSize = 0;
    uint32_t crc32 = 0;             // CRC несжатых байт

    bool isCompressed = false;      // payload сжат deflate
    uint32_t originalSize = 0;      // Длина payload до сжатия

    /// Геометрия блока, заявленная в заголовке
    BlockLayout layout() const;

    /// Собрать сообщение по дескриптору и данным (crc32 вычисляется)
    static ChunkMessage fromDescriptor(const std::string& transferId,
                                       const ChunkDescriptor& desc,
                                       uint32_t totalChunks,
                                       std::vector<uint8_t> payload);
};

// ═══════════════════════════════════════════════════════════
// Состояние приёма блока
// ═══════════════════════════════════════════════════════════

enum class BlockStatus {
    Incomplete,     // Не хватает chunk'ов, ещё могут прийти
    Complete,       // Все data слоты получены
    Reconstructed,  // Недостающие слоты восстановлены через parity
    Unrecoverable   // Блок закрыт, потерь больше, чем покрывает parity
};

IR_API const char* blockStatusName(BlockStatus status);

struct IR_API BlockState {
    BlockLayout layout;
    std::bitset<MAX_FEC_BLOCK_CHUNKS> present;
    std::vector<std::optional<std::vector<uint8_t>>> parity;
    bool closed = false;            // Больше chunk'ов этого блока не будет
    bool finalized = false;         // Complete/Reconstructed уже зафиксирован

    explicit BlockState(const BlockLayout& l) : layout(l), parity(l.parityCount) {}

    uint32_t missingCount() const;
    bool allDataPresent() const { return missingCount() == 0; }
};

enum class ChunkDecodeStatus {
    Accepted,       // Chunk записан
    Duplicate,      // Слот уже заполнен
    Corrupt,        // CRC не совпал, считается потерянным
    Invalid         // Заголовок не согласуется с геометрией блока
};

struct ChunkDecodeResult {
    ChunkDecodeStatus status = ChunkDecodeStatus::Invalid;
    uint32_t newBytes = 0;          // Новых подтверждённых байт данных
};

struct BlockFinalizeResult {
    BlockStatus status = BlockStatus::Incomplete;
    std::vector<uint32_t> reconstructedSlots;
    uint64_t reconstructedBytes = 0;
};

// ═══════════════════════════════════════════════════════════
// ChunkCodec
// ═══════════════════════════════════════════════════════════

class IR_API ChunkCodec {
public:
    /// ceil(ratio × dataChunks), не больше dataChunks; 0 при ratio <= 0
    static uint32_t parityCountFor(uint32_t dataChunks, double parityRatio);

    /// Спланировать блок, начинающийся с blockOffset
    /// @param maxBlockChunks 1..64; без FEC обычно 1
    static BlockLayout planBlock(int64_t fileSize, int64_t blockOffset, uint32_t firstIndex,
                                 size_t chunkSize, size_t maxBlockChunks, double parityRatio);

    /// Детерминированно разбить [0, sourceLength) на блоки фиксированного chunkSize.
    /// Порядок: data chunk'и блока, затем его parity chunk'и.
    static std::vector<ChunkDescriptor> encode(int64_t sourceLength, size_t chunkSize,
                                               double parityRatio,
                                               size_t blockChunks = DEFAULT_FEC_BLOCK_CHUNKS);

    /// Дескрипторы одного блока в порядке отправки
    static std::vector<ChunkDescriptor> describeBlock(const BlockLayout& layout);

    /// Оценка общего числа data chunk'ов при текущем размере chunk'а
    static uint32_t estimateTotalChunks(int64_t fileSize, int64_t offset,
                                        uint32_t nextIndex, size_t chunkSize);

    /// Записать chunk в буфер сборки и отметить слот
    /// @param assembly Буфер размера файла
    static ChunkDecodeResult decodeChunk(BlockState& state, const ChunkMessage& chunk,
                                         std::vector<uint8_t>& assembly);

    /// Попытаться завершить блок, восстанавливая недостающие слоты через XOR
    static BlockFinalizeResult finalizeBlock(BlockState& state, std::vector<uint8_t>& assembly);
};

// ═══════════════════════════════════════════════════════════
// BlockEncoder — накопление parity на стороне отправителя
// ═══════════════════════════════════════════════════════════

class IR_API BlockEncoder {
public:
    explicit BlockEncoder(const BlockLayout& layout);

    /// XOR data слота в parity его группы
    void addDataChunk(uint32_t slot, const uint8_t* data, size_t size);
    void addDataChunk(uint32_t slot, const std::vector<uint8_t>& data) {
        addDataChunk(slot, data.data(), data.size());
    }

    const BlockLayout& layout() const { return m_layout; }
    const std::vector<uint8_t>& parityChunk(uint32_t parityIndex) const;

private:
    BlockLayout m_layout;
    std::vector<std::vector<uint8_t>> m_parity;
};

} // namespace Innerocket
